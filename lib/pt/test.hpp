/* This file is part of the programmable-tokens project.
 * Copyright (c) 2025 the programmable-tokens contributors */
#ifndef PROGRAMMABLE_TOKENS_TEST_HPP
#define PROGRAMMABLE_TOKENS_TEST_HPP

#define BOOST_UT_DISABLE_MODULE 1
#include <filesystem>
#include <iostream>
#include <boost/ut.hpp>
#include <pt/array.hpp>
#include <pt/error.hpp>
#include <pt/logger.hpp>

namespace programmable_tokens {
    using namespace boost::ut;

    struct test_printer: boost::ut::printer {
        template<class T>
        test_printer& operator<<(T &&t) {
            std::cerr << std::forward<T>(t);
            return *this;
        }

        test_printer& operator<<(const std::string_view sv) {
            std::cerr << sv;
            return *this;
        }
    };

    template<typename T, typename Y>
    void test_same(const T &x, const Y &y, const std::source_location &loc=std::source_location::current())
    {
        expect(x == static_cast<T>(y), loc) << fmt::format("{} != {}", x, y);
    }

    // A fresh per-test directory under the system temp dir, removed at scope exit
    struct test_dir {
        explicit test_dir(const std::string_view name):
            _path { (std::filesystem::temp_directory_path() / fmt::format("pt-test-{}", name)).string() }
        {
            std::filesystem::remove_all(_path);
            std::filesystem::create_directories(_path);
        }

        ~test_dir()
        {
            std::error_code ec {};
            std::filesystem::remove_all(_path, ec);
        }

        const std::string &path() const noexcept
        {
            return _path;
        }
    private:
        std::string _path;
    };
}

template <class... Ts>
inline auto boost::ut::cfg<boost::ut::override, Ts...> = boost::ut::runner<boost::ut::reporter<programmable_tokens::test_printer>> {};

#endif // !PROGRAMMABLE_TOKENS_TEST_HPP
