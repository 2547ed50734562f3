#pragma once


enum block_family {
    plate = 0,
    brick
};

enum color_mode {
    quantized = 0,  // nearest curated palette code
    direct          // literal rgb as LDraw direct color
};
