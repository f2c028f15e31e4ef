#include "core/CamelotKey.h"

#include <cstdlib>

namespace harmonicflow {

std::optional<CamelotKey> CamelotKey::fromCode(const std::string& code)
{
    if (code.size() < 2 || code.size() > 3)
        return std::nullopt;

    char letter = code.back();
    if (letter != 'A' && letter != 'B')
        return std::nullopt;

    std::string digits = code.substr(0, code.size() - 1);
    if (digits[0] == '0')
        return std::nullopt;
    for (char c : digits)
    {
        if (c < '0' || c > '9')
            return std::nullopt;
    }

    int number = std::atoi(digits.c_str());
    if (number < 1 || number > 12)
        return std::nullopt;

    CamelotKey key;
    key.number = number;
    key.ring = (letter == 'A') ? Ring::minor : Ring::major;
    return key;
}

std::string CamelotKey::toString() const
{
    return std::to_string(number) + (ring == Ring::minor ? "A" : "B");
}

int keyDistance(const CamelotKey& a, const CamelotKey& b)
{
    int diff = std::abs(a.number - b.number);
    int numDiff = diff < 12 - diff ? diff : 12 - diff;

    if (a.ring == b.ring)
        return numDiff;

    // Crossing rings costs one extra step; at numDiff == 0 this is the
    // relative major/minor swap.
    return numDiff + 1;
}

int keyDistance(const std::string& a, const std::string& b)
{
    auto ka = CamelotKey::fromCode(a);
    auto kb = CamelotKey::fromCode(b);
    if (!ka || !kb)
        return kUnknownKeyDistance;
    return keyDistance(*ka, *kb);
}

} // namespace harmonicflow
