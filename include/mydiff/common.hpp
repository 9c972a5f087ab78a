#pragma once

#include <cstdint>
#include <initializer_list>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace mydiff {

using Bytes = std::vector<std::uint8_t>;
using ByteView = std::span<std::uint8_t const>;

using StringViewPair = std::pair<std::string_view, std::string_view>;
using StringPair = std::pair<std::string, std::string>;

// Helper function to create a literal span
template <typename T>
std::span<T const> span(std::initializer_list<T> contiguous)
{
    return std::span<T const>(contiguous.begin(), contiguous.size());
}

// Visitor built from a set of lambdas, for exhaustive std::visit
template <typename... Fs>
struct overloaded : Fs... { using Fs::operator()...; };
template <typename... Fs>
overloaded(Fs...) -> overloaded<Fs...>;

// View text as raw bytes, and the reverse
ByteView as_bytes(std::string_view text);
std::string_view as_chars(ByteView bytes);

Bytes to_bytes(std::string_view text);

// Lowercase hexadecimal rendering
std::string to_hex(ByteView bytes);

std::string_view trim(std::string_view text);

}
