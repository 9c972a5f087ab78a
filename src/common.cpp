#include <mydiff/common.hpp>

#include <cctype>

namespace mydiff {

ByteView as_bytes(std::string_view text)
{
    return ByteView(reinterpret_cast<std::uint8_t const*>(text.data()), text.size());
}

std::string_view as_chars(ByteView bytes)
{
    return std::string_view(reinterpret_cast<char const*>(bytes.data()), bytes.size());
}

Bytes to_bytes(std::string_view text)
{
    return Bytes(text.begin(), text.end());
}

std::string to_hex(ByteView bytes)
{
    static char const* hex = "0123456789abcdef";
    std::string result;
    result.reserve(bytes.size() * 2);
    for (auto byte : bytes) {
        result += hex[(byte >> 4) & 0xF];
        result += hex[byte & 0xF];
    }
    return result;
}

std::string_view trim(std::string_view text)
{
    size_t start = 0, end = text.size();
    while (start < end && std::isspace((unsigned char)text[start])) {
        ++ start;
    }
    while (end > start && std::isspace((unsigned char)text[end - 1])) {
        -- end;
    }
    return text.substr(start, end - start);
}

}
