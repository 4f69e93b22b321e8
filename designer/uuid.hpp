#ifndef QUILTBLOCK_DESIGNER_UUID_HPP
#define QUILTBLOCK_DESIGNER_UUID_HPP

#include <random>
#include <string>

namespace quiltblock {

// Random version 4 UUID, e.g. "3f2b8c1e-9a4d-4e7b-b2c5-0d1e2f3a4b5c"
inline std::string generate_uuid(std::mt19937_64& rng) {
    std::uniform_int_distribution<int> hex(0, 15);
    std::uniform_int_distribution<int> variant(8, 11);
    const char* digits = "0123456789abcdef";

    std::string id = "xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx";
    for (auto& c : id) {
        if (c == 'x') c = digits[hex(rng)];
        else if (c == 'y') c = digits[variant(rng)];
    }
    return id;
}

}  // namespace quiltblock

#endif // QUILTBLOCK_DESIGNER_UUID_HPP
