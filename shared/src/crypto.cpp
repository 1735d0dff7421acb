#include "drcv/crypto.hpp"

#include <cstdint>
#include <mutex>
#include <stdexcept>

#include <sodium.h>

namespace drcv::crypto
{

    namespace
    {

        constexpr std::string_view kIdentifierAlphabet = "abcdefghijklmnopqrstuvwxyz0123456789";

        void throw_if_sodium_init_failed(int status)
        {
            if (status < 0)
            {
                throw std::runtime_error("libsodium initialization failed");
            }
        }

        std::once_flag &sodium_once_flag()
        {
            static std::once_flag flag;
            return flag;
        }

        void ensure_initialized_once()
        {
            std::call_once(sodium_once_flag(), []()
                           { throw_if_sodium_init_failed(sodium_init()); });
        }

    } // namespace

    std::string random_string(std::size_t length, std::string_view alphabet)
    {
        if (alphabet.empty())
        {
            throw std::invalid_argument("random_string requires a non-empty alphabet");
        }
        ensure_initialized_once();
        std::string result;
        result.reserve(length);
        const auto upper = static_cast<std::uint32_t>(alphabet.size());
        for (std::size_t i = 0; i < length; ++i)
        {
            result.push_back(alphabet[randombytes_uniform(upper)]);
        }
        return result;
    }

    std::string random_identifier(std::size_t length)
    {
        return random_string(length, kIdentifierAlphabet);
    }

} // namespace drcv::crypto
