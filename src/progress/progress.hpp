#ifndef PROGRESS_HPP
#define PROGRESS_HPP

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace progress
{
    struct ProgressRecord
    {
        std::size_t completed = 0;
        std::size_t total = 0;
        std::string timestamp;
    };

    // Single JSON record describing how far a batch baseline run got.
    // A missing file means there is nothing to resume.
    class ProgressTracker
    {
    public:
        explicit ProgressTracker(const std::filesystem::path &file);

        bool save(std::size_t completed, std::size_t total);
        std::optional<ProgressRecord> load() const;
        bool clear();

        const std::filesystem::path &file() const { return file_; }

    private:
        std::filesystem::path file_;
    };
} // namespace progress

#endif // PROGRESS_HPP
