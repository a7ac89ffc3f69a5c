#include "namecraft/word_source.hpp"

#include <memory>

namespace namecraft {

const std::shared_ptr<const WordList>& WordSource::DefaultAdjectives() {
    static const std::shared_ptr<const WordList> adjectives = std::make_shared<const WordList>(WordList{
        "abiding", "able", "abundant", "adorable", "adventurous", "aged", "agile", "agreeable",
        "alert", "alive", "amazing", "ambitious", "amused", "ancient", "angry", "anxious",
        "aquatic", "arctic", "arid", "aromatic", "artistic", "ashamed", "astute", "attractive",
        "austere", "automatic", "average", "awake", "aware", "awesome", "balanced", "bashful",
        "beautiful", "bewildered", "big", "bitter", "bizarre", "blazing", "bold", "bouncy",
        "brainy", "brave", "breezy", "brief", "bright", "brilliant", "brisk", "broad",
        "bronze", "bubbly", "bulky", "bumpy", "busy", "calm", "capable", "careful",
        "caring", "cautious", "charming", "cheerful", "chilly", "chubby", "clean", "clever",
        "cloudy", "clumsy", "coastal", "colorful", "comfy", "common", "cool", "cosmic",
        "courageous", "cozy", "crafty", "crazy", "creative", "crimson", "crisp", "crooked",
        "crunchy", "cuddly", "curious", "curly", "cute", "daring", "dashing", "dazzling",
        "decent", "deep", "delicate", "delightful", "dependable", "desert", "determined", "devoted",
        "diligent", "dizzy", "dreamy", "dusty", "dynamic", "eager", "early", "earnest",
        "easy", "eclectic", "elastic", "elated", "elegant", "eloquent", "emerald", "enchanted",
        "endless", "energetic", "enormous", "epic", "equal", "ethereal", "exotic", "fabulous",
        "fair", "faithful", "famous", "fancy", "fearless", "feisty", "fierce", "fiery",
        "flashy", "flat", "fluffy", "flying", "fond", "frank", "free", "fresh",
        "friendly", "frosty", "frozen", "funny", "fuzzy", "gallant", "gentle", "giant",
        "gifted", "gigantic", "gleaming", "glorious", "glossy", "golden", "good", "graceful",
        "grand", "grateful", "great", "green", "grumpy", "happy", "hardy", "harmonious",
        "hasty", "healthy", "hearty", "heavy", "helpful", "heroic", "hidden", "hollow",
        "honest", "hopeful", "huge", "humble", "hungry", "icy", "ideal", "immense",
        "impish", "infinite", "innocent", "inspired", "intrepid", "jagged", "jazzy", "jolly",
        "jovial", "joyful", "juicy", "keen", "kind", "knowing", "large", "lavish",
        "lazy", "legal", "lemon", "light", "likable", "little", "lively", "loud",
        "lovely", "loyal", "lucky", "lunar", "magical", "majestic", "mellow", "merry",
        "mighty", "mild", "misty", "modest", "molten", "muddy", "musical", "mysterious",
        "narrow", "neat", "nervous", "nifty", "nimble", "noble", "noisy", "nutty",
        "obedient", "odd", "optimal", "orange", "ornate", "pale", "patient", "peaceful",
        "perfect", "pink", "placid", "plain", "pleasant", "plucky", "polished", "polite",
        "proud", "purple", "quick", "quiet", "quirky", "radiant", "rapid", "rare",
        "ready", "red", "regal", "relaxed", "resolute", "rich", "robust", "rocky",
        "rosy", "round", "royal", "rugged", "rusty", "sandy", "sassy", "scarlet",
        "secret", "serene", "shaggy", "sharp", "shiny", "silent", "silky", "silly",
        "simple", "sleek", "sleepy", "slender", "slick", "slow", "small", "smart",
        "smooth", "snappy", "snowy", "soft", "solar", "solid", "sparkling", "speedy",
        "spicy", "spiffy", "splendid", "spotless", "steady", "stellar", "stormy", "striped",
        "strong", "sturdy", "subtle", "sunny", "super", "sweet", "swift", "tall",
        "tame", "tangy", "tender", "thirsty", "tidy", "tiny", "tough", "tranquil",
        "tricky", "trusty", "twinkling", "unique", "upbeat", "valiant", "velvet", "vibrant",
        "vigilant", "violet", "vivid", "warm", "wary", "wavy", "wild", "windy",
        "wise", "witty", "wobbly", "wonderful", "yellow", "young", "youthful", "zany",
        "zealous", "zesty",
    });
    return adjectives;
}

const std::shared_ptr<const WordList>& WordSource::DefaultNouns() {
    static const std::shared_ptr<const WordList> nouns = std::make_shared<const WordList>(WordList{
        "acorn", "airplane", "alley", "anchor", "angle", "ant", "apple", "apricot",
        "arch", "arm", "arrow", "asteroid", "atom", "attic", "avocado", "axe",
        "badge", "bag", "bagel", "ball", "balloon", "bamboo", "banana", "band",
        "bank", "barn", "basket", "bat", "beach", "beacon", "bean", "bear",
        "beaver", "bed", "bee", "bell", "bench", "berry", "bicycle", "bird",
        "biscuit", "blade", "blanket", "blossom", "boat", "bolt", "bone", "book",
        "boot", "bottle", "boulder", "bow", "bowl", "box", "branch", "breeze",
        "brick", "bridge", "brook", "broom", "brush", "bubble", "bucket", "buckle",
        "bug", "bumper", "butter", "button", "cabin", "cable", "cactus", "cake",
        "camel", "camera", "candle", "canoe", "canyon", "cape", "car", "card",
        "carpet", "carrot", "castle", "cat", "cave", "cedar", "cello", "chair",
        "chalk", "cheese", "cherry", "chest", "chimney", "cloud", "clover", "coast",
        "coat", "comet", "compass", "cookie", "coral", "cork", "cotton", "cow",
        "crab", "crane", "crayon", "creek", "cricket", "crow", "crown", "crystal",
        "cup", "curtain", "cushion", "daisy", "dawn", "deer", "desk", "diamond",
        "dolphin", "door", "dove", "dragon", "drum", "duck", "dune", "eagle",
        "earth", "echo", "egg", "elbow", "elephant", "elm", "ember", "engine",
        "falcon", "feather", "fence", "fern", "field", "fig", "finch", "fire",
        "flag", "flame", "flask", "flower", "flute", "fog", "forest", "fossil",
        "fountain", "fox", "frog", "garden", "gate", "gazelle", "gem", "geyser",
        "ghost", "glacier", "glove", "goat", "gorilla", "grape", "grass", "guitar",
        "gull", "hammer", "harbor", "harp", "hat", "hawk", "hazel", "heart",
        "hedge", "helmet", "heron", "hill", "hippo", "honey", "horizon", "horse",
        "hut", "iceberg", "igloo", "island", "ivy", "jacket", "jaguar", "jar",
        "jelly", "jewel", "kayak", "kettle", "key", "kite", "kitten", "koala",
        "ladder", "lagoon", "lake", "lamp", "lantern", "leaf", "lemon", "leopard",
        "lighthouse", "lily", "lion", "lizard", "llama", "lobster", "lock", "lotus",
        "magnet", "mango", "maple", "marble", "meadow", "melon", "meteor", "mirror",
        "mitten", "mole", "monkey", "moon", "moose", "moss", "mountain", "mouse",
        "mushroom", "nail", "needle", "nest", "net", "newt", "oak", "oasis",
        "ocean", "octopus", "olive", "onion", "orbit", "orchid", "otter", "owl",
        "oyster", "paddle", "palm", "panda", "panther", "paper", "parrot", "peach",
        "peak", "pear", "pebble", "pelican", "pen", "pencil", "penguin", "pepper",
        "piano", "pickle", "pigeon", "pillow", "pine", "planet", "plum", "pond",
        "pony", "poppy", "potato", "prairie", "puffin", "pumpkin", "puppy", "quail",
        "quartz", "quill", "rabbit", "raccoon", "radish", "rain", "rainbow", "raven",
        "reef", "ribbon", "river", "road", "robin", "rocket", "rose", "ruby",
        "sail", "salmon", "sapphire", "satellite", "saturn", "scarf", "seal", "seed",
        "shadow", "shark", "sheep", "shell", "ship", "shoe", "shore", "skunk",
        "sky", "sloth", "snail", "snake", "snowflake", "sparrow", "sphinx", "spider",
        "sponge", "spoon", "spruce", "squirrel", "star", "stone", "storm", "stream",
        "sun", "swan", "table", "teapot", "thistle", "thunder", "tiger", "toad",
        "tomato", "torch", "tortoise", "tower", "tree", "trout", "trumpet", "tulip",
        "tundra", "turtle", "umbrella", "unicorn", "valley", "vase", "violin", "volcano",
        "wagon", "walrus", "wave", "whale", "wheel", "whistle", "willow", "wind",
        "window", "wolf", "wombat", "yak", "yarn", "zebra", "zephyr",
    });
    return nouns;
}

}  // namespace namecraft
