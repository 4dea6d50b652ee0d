#ifndef BASELINE_STORE_HPP
#define BASELINE_STORE_HPP

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include "../cells/cells.hpp"
#include "../codec/codec.hpp"
#include "../errors/status.hpp"

namespace baseline_store
{
    namespace fs = std::filesystem;

    struct StoreOptions
    {
        unsigned int max_retries = 5;
        std::chrono::milliseconds retry_base_delay{200};
    };

    // Points inside save() where a fault hook is invoked.
    enum class SaveStage
    {
        TempWritten,   // temp file written and flushed, not yet verified
        BackupCreated, // prior artifact copied aside and deleted
        BeforeMove     // about to move the temp file into place
    };

    // One compressed artifact per monitored file, named
    // "<fileKey>.baseline.json.<codec extension>".
    //
    // Writes for the same key are not coordinated here; callers keep a single
    // writer per key. Different keys may be written in parallel.
    class BaselineStore
    {
    public:
        BaselineStore(const fs::path &directory, const codec::Codec *defaultCodec,
                      StoreOptions options = StoreOptions());

        // Looks through every known codec extension in priority order. Falls back
        // to a leftover backup when a crash removed the artifact mid-save.
        errors::Status load(const std::string &fileKey, cells::Baseline &out) const;

        // Crash-safe replace with retries. Stamps a fresh timestamp.
        // Returns false once every attempt failed; the old artifact stays in place.
        bool save(const std::string &fileKey, const cells::Baseline &baseline);

        // Re-encodes an existing baseline with another codec. The old artifact is
        // removed only after the new one has been verified.
        errors::Status migrate(const std::string &fileKey, const codec::Codec *targetCodec);

        // Renames the artifact together with its spreadsheet.
        errors::Status rename(const std::string &oldKey, const std::string &newKey);

        bool exists(const std::string &fileKey) const;
        bool remove(const std::string &fileKey);
        std::size_t purge();

        // Removes stray temp files and restores backups whose artifact is missing.
        std::size_t recover();

        // Moves every artifact untouched for `olderThan` to `archiveCodec`.
        std::size_t archiveInactive(std::chrono::hours olderThan, const codec::Codec *archiveCodec);

        std::vector<std::string> listKeys() const;

        fs::path artifactPath(const std::string &fileKey, const codec::Codec &c) const;
        const fs::path &directory() const { return directory_; }
        const codec::Codec *defaultCodec() const { return defaultCodec_; }

        // Fault injection for exercising the save protocol.
        void setFaultHook(std::function<void(SaveStage)> hook) { faultHook_ = std::move(hook); }

    private:
        bool saveWith(const std::string &fileKey, const cells::Baseline &baseline,
                      const codec::Codec &c, bool keepTimestamp);
        void removeStaleArtifacts(const std::string &fileKey, const codec::Codec &keep);
        errors::Status decodeArtifact(const fs::path &path, const codec::Codec &c, cells::Baseline &out) const;
        std::string uniqueSuffix(unsigned int attempt);
        void fault(SaveStage stage);

        fs::path directory_;
        const codec::Codec *defaultCodec_;
        StoreOptions options_;
        std::atomic<unsigned long> counter_;
        std::function<void(SaveStage)> faultHook_;
    };

    // True if the key is a plain file name usable as an artifact name.
    bool isValidKey(const std::string &fileKey);
} // namespace baseline_store

#endif // BASELINE_STORE_HPP
