#include "session_id.hpp"

#include <cctype>
#include <cstdint>
#include <mutex>
#include <random>

namespace termpane
{

namespace
{

std::mt19937_64& id_engine()
{
    static std::mt19937_64 engine{[]
                                  {
                                      std::random_device rd;
                                      std::seed_seq seq{rd(), rd(), rd(), rd()};
                                      return std::mt19937_64(seq);
                                  }()};
    return engine;
}

std::mutex s_id_mutex;

constexpr bool is_dash_position(size_t i)
{
    return i == 8 || i == 13 || i == 18 || i == 23;
}

}   // anonymous namespace

SessionId generate_session_id()
{
    uint64_t hi = 0;
    uint64_t lo = 0;
    {
        std::lock_guard<std::mutex> lock(s_id_mutex);
        hi = id_engine()();
        lo = id_engine()();
    }

    // Version 4, variant 10xx.
    hi = (hi & 0xFFFFFFFFFFFF0FFFull) | 0x0000000000004000ull;
    lo = (lo & 0x3FFFFFFFFFFFFFFFull) | 0x8000000000000000ull;

    static constexpr char HEX[] = "0123456789abcdef";

    SessionId out;
    out.reserve(36);
    for (int i = 0; i < 32; ++i)
    {
        uint64_t word  = i < 16 ? hi : lo;
        int      shift = 60 - 4 * (i % 16);
        out.push_back(HEX[(word >> shift) & 0xF]);
        if (is_dash_position(out.size()))
            out.push_back('-');
    }
    return out;
}

bool is_valid_session_id(std::string_view text)
{
    if (text.size() != 36)
        return false;

    for (size_t i = 0; i < text.size(); ++i)
    {
        char c = text[i];
        if (is_dash_position(i))
        {
            if (c != '-')
                return false;
        }
        else if (!std::isxdigit(static_cast<unsigned char>(c)))
        {
            return false;
        }
    }
    return true;
}

std::string short_session_id(std::string_view id)
{
    return std::string(id.substr(0, 8));
}

}   // namespace termpane
