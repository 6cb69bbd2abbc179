#ifndef ARBOR_TEST_COMMON_HPP
#define ARBOR_TEST_COMMON_HPP

#include <atomic>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <system_error>

namespace Arbor::Test {
    inline int& failures()
    {
        static int count = 0;
        return count;
    }

    inline void expect(bool condition, const std::string& what)
    {
        if (!condition) {
            ++failures();
            std::cerr << "FAIL: " << what << std::endl;
        }
    }

    inline void expect_near(double actual, double expected, const std::string& what, double tolerance = 1e-6)
    {
        expect(std::fabs(actual - expected) <= tolerance,
               what + " (got " + std::to_string(actual) + ", expected " + std::to_string(expected) + ")");
    }

    template <class Exception, class Callable>
    void expect_throws(Callable&& callable, const std::string& what)
    {
        try {
            callable();
        } catch (const Exception&) {
            return;
        } catch (const std::exception& error) {
            expect(false, what + " (threw a different exception: " + error.what() + ")");
            return;
        }
        expect(false, what + " (nothing thrown)");
    }

    inline int report(const std::string& suite)
    {
        if (failures() == 0) {
            std::cout << suite << ": all checks passed" << std::endl;
            return 0;
        }
        std::cerr << suite << ": " << failures() << " check(s) failed" << std::endl;
        return 1;
    }

    // Fresh directory under the system temp dir, removed on destruction.
    class TempDir {
    public:
        explicit TempDir(const std::string& tag)
        {
            static std::atomic<int> counter{0};
            const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
            path_ = std::filesystem::temp_directory_path()
                / ("arbor-" + tag + "-" + std::to_string(stamp) + "-" + std::to_string(counter++));
            std::filesystem::create_directories(path_);
        }

        ~TempDir()
        {
            std::error_code error;
            std::filesystem::remove_all(path_, error);
        }

        TempDir(const TempDir&) = delete;
        TempDir& operator=(const TempDir&) = delete;

        [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

        std::filesystem::path write(const std::string& name, const std::string& contents) const
        {
            const auto target = path_ / name;
            if (target.has_parent_path()) {
                std::filesystem::create_directories(target.parent_path());
            }
            std::ofstream stream(target, std::ios::trunc);
            stream << contents;
            return target;
        }

    private:
        std::filesystem::path path_;
    };

    inline std::string slurp(const std::filesystem::path& path)
    {
        std::ifstream stream(path);
        return std::string(std::istreambuf_iterator<char>(stream), std::istreambuf_iterator<char>());
    }

    // Two short sentences with full annotation.
    inline const char* kTinyTreebank =
        "# sent_id = 1\n"
        "# text = The dog barks.\n"
        "1\tThe\tthe\tDET\tDT\t_\t2\tdet\t_\t_\n"
        "2\tdog\tdog\tNOUN\tNN\t_\t3\tnsubj\t_\t_\n"
        "3\tbarks\tbark\tVERB\tVBZ\t_\t0\troot\t_\t_\n"
        "4\t.\t.\tPUNCT\t.\t_\t3\tpunct\t_\t_\n"
        "\n"
        "# sent_id = 2\n"
        "1\tCats\tcat\tNOUN\tNNS\t_\t2\tnsubj\t_\t_\n"
        "2\tsleep\tsleep\tVERB\tVBP\t_\t0\troot\t_\t_\n"
        "\n";
}

#endif // ARBOR_TEST_COMMON_HPP
