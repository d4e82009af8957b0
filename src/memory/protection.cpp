/// @file protection.cpp
/// @brief ProtectionFlags text form

#include <enclave/memory/protection.hpp>

namespace enclave_memory {

std::string ProtectionFlags::to_string() const {
    std::string result = "---";
    if (read) result[0] = 'r';
    if (write) result[1] = 'w';
    if (execute) result[2] = 'x';
    return result;
}

std::optional<ProtectionFlags> ProtectionFlags::parse(const std::string& str) {
    if (str.size() != 3) {
        return std::nullopt;
    }

    auto flag = [](char c, char set) -> std::optional<bool> {
        if (c == set) return true;
        if (c == '-') return false;
        return std::nullopt;
    };

    auto r = flag(str[0], 'r');
    auto w = flag(str[1], 'w');
    auto x = flag(str[2], 'x');
    if (!r || !w || !x) {
        return std::nullopt;
    }
    return ProtectionFlags{*r, *w, *x};
}

} // namespace enclave_memory
