#include "Base64.hpp"

#include <array>
#include <cstdint>

namespace
{

constexpr std::string_view kAlphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
                                       "abcdefghijklmnopqrstuvwxyz"
                                       "0123456789+/";

constexpr char kPadding = '=';
constexpr std::uint8_t kInvalid = 0xFF;

constexpr std::array<std::uint8_t, 256> buildDecodeTable()
{
    std::array<std::uint8_t, 256> table{};
    table.fill(kInvalid);
    for (std::size_t i = 0; i < kAlphabet.size(); ++i)
    {
        table[static_cast<std::uint8_t>(kAlphabet[i])] = static_cast<std::uint8_t>(i);
    }
    return table;
}

constexpr auto kDecodeTable = buildDecodeTable();

} // namespace

namespace utils
{

std::string Base64Encode(std::string_view data)
{
    std::string out;
    if (data.empty())
        return out;

    out.reserve(((data.size() + 2) / 3) * 4);

    std::size_t i = 0;
    for (; i + 3 <= data.size(); i += 3)
    {
        const std::uint32_t block = (static_cast<std::uint8_t>(data[i]) << 16) |
                                    (static_cast<std::uint8_t>(data[i + 1]) << 8) |
                                    static_cast<std::uint8_t>(data[i + 2]);
        out.push_back(kAlphabet[(block >> 18) & 0x3F]);
        out.push_back(kAlphabet[(block >> 12) & 0x3F]);
        out.push_back(kAlphabet[(block >> 6) & 0x3F]);
        out.push_back(kAlphabet[block & 0x3F]);
    }

    const std::size_t rest = data.size() - i;
    if (rest == 1)
    {
        const std::uint32_t block = static_cast<std::uint8_t>(data[i]) << 16;
        out.push_back(kAlphabet[(block >> 18) & 0x3F]);
        out.push_back(kAlphabet[(block >> 12) & 0x3F]);
        out.push_back(kPadding);
        out.push_back(kPadding);
    }
    else if (rest == 2)
    {
        const std::uint32_t block =
            (static_cast<std::uint8_t>(data[i]) << 16) | (static_cast<std::uint8_t>(data[i + 1]) << 8);
        out.push_back(kAlphabet[(block >> 18) & 0x3F]);
        out.push_back(kAlphabet[(block >> 12) & 0x3F]);
        out.push_back(kAlphabet[(block >> 6) & 0x3F]);
        out.push_back(kPadding);
    }

    return out;
}

bool Base64Decode(std::string_view encoded, std::string& out)
{
    out.clear();
    if (encoded.empty())
        return true;
    if (encoded.size() % 4 != 0)
        return false;

    std::size_t padding = 0;
    if (encoded.back() == kPadding)
        ++padding;
    if (encoded.size() >= 2 && encoded[encoded.size() - 2] == kPadding)
        ++padding;

    out.reserve((encoded.size() / 4) * 3 - padding);

    for (std::size_t i = 0; i < encoded.size(); i += 4)
    {
        const bool lastQuad = i + 4 == encoded.size();
        std::uint32_t block = 0;
        for (std::size_t j = 0; j < 4; ++j)
        {
            const char c = encoded[i + j];
            std::uint8_t value = 0;
            if (c == kPadding)
            {
                // Padding only in the trailing positions of the final quad
                if (!lastQuad || j < 4 - padding)
                    return false;
            }
            else
            {
                value = kDecodeTable[static_cast<std::uint8_t>(c)];
                if (value == kInvalid)
                    return false;
            }
            block = (block << 6) | value;
        }

        out.push_back(static_cast<char>((block >> 16) & 0xFF));
        if (!lastQuad || padding < 2)
            out.push_back(static_cast<char>((block >> 8) & 0xFF));
        if (!lastQuad || padding < 1)
            out.push_back(static_cast<char>(block & 0xFF));
    }

    return true;
}

} // namespace utils
