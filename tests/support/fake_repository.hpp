#pragma once

#include "labsync/remote/repository_api.hpp"

#include <chrono>
#include <fstream>
#include <iterator>
#include <map>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

namespace labsync::test_support {

/**
 * @brief In-memory repository for scanner, coordinator and engine tests
 *
 * Thread-safe. Failure injection counters make the next N calls of an
 * operation fail with a Transport error.
 */
class FakeRepository : public remote::RepositoryApi {
public:
    struct Verification {
        std::int64_t datafile_id;
        std::chrono::steady_clock::time_point at;
    };

    void add_user(const std::string& username, const std::string& email = {},
                  const std::string& display_name = {}) {
        std::lock_guard<std::mutex> lock(mutex_);
        model::Owner owner;
        owner.kind = model::OwnerKind::Individual;
        owner.id = next_id_++;
        owner.username = username;
        owner.email = email;
        owner.display_name = display_name.empty() ? username : display_name;
        users_.push_back(owner);
    }

    void add_group(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        model::Owner owner;
        owner.kind = model::OwnerKind::Group;
        owner.id = next_id_++;
        owner.display_name = name;
        groups_.push_back(owner);
    }

    /// Pre-existing datafile record in dataset_id.
    std::int64_t add_datafile(std::int64_t dataset_id, const std::string& filename,
                              const std::string& directory, std::uint64_t size,
                              bool verified, const std::string& replica_uri = {}) {
        std::lock_guard<std::mutex> lock(mutex_);
        Record record;
        record.dataset_id = dataset_id;
        record.file.id = next_id_++;
        record.file.filename = filename;
        record.file.directory = directory;
        record.file.size = size;
        record.file.verified = verified;
        record.file.replica_uri = replica_uri;
        records_.push_back(record);
        return record.file.id;
    }

    Result<std::vector<model::Owner>> find_user_by_username(const std::string& username) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++lookups_;
        std::vector<model::Owner> found;
        for (const auto& user : users_) {
            if (user.username == username) {
                found.push_back(user);
            }
        }
        return Ok(found);
    }

    Result<std::vector<model::Owner>> find_user_by_email(const std::string& email) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++lookups_;
        std::vector<model::Owner> found;
        for (const auto& user : users_) {
            if (!user.email.empty() && user.email == email) {
                found.push_back(user);
            }
        }
        return Ok(found);
    }

    Result<std::vector<model::Owner>> find_group_by_name(const std::string& name) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++lookups_;
        std::vector<model::Owner> found;
        for (const auto& group : groups_) {
            if (group.display_name == name) {
                found.push_back(group);
            }
        }
        return Ok(found);
    }

    Result<std::int64_t> get_or_create_experiment(const model::FolderRecord& folder) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = experiments_.find(folder.experiment_title);
        if (it != experiments_.end()) {
            return Ok(it->second);
        }
        const auto id = next_id_++;
        experiments_[folder.experiment_title] = id;
        return Ok(id);
    }

    Result<std::int64_t> get_or_create_dataset(const model::FolderRecord& folder,
                                               std::int64_t experiment_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto key = std::to_string(experiment_id) + "/" + folder.name;
        auto it = datasets_.find(key);
        if (it != datasets_.end()) {
            return Ok(it->second);
        }
        const auto id = next_id_++;
        datasets_[key] = id;
        return Ok(id);
    }

    Result<std::optional<remote::RemoteDatafile>> find_datafile(std::int64_t dataset_id,
                                                                const std::string& filename,
                                                                const std::string& directory) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++find_calls_;
        if (fail_finds_ > 0) {
            --fail_finds_;
            return Err(ErrorKind::Transport, "injected lookup failure");
        }
        for (const auto& record : records_) {
            if (record.dataset_id == dataset_id && record.file.filename == filename &&
                record.file.directory == directory) {
                return Ok(std::optional<remote::RemoteDatafile>(record.file));
            }
        }
        return Ok(std::optional<remote::RemoteDatafile>());
    }

    Result<remote::StagedDatafile> create_staged_datafile(const remote::DatafileDescriptor& descriptor) override {
        std::lock_guard<std::mutex> lock(mutex_);
        Record record;
        record.dataset_id = descriptor.dataset_id;
        record.file.id = next_id_++;
        record.file.filename = descriptor.filename;
        record.file.directory = descriptor.directory;
        record.file.size = descriptor.size;
        record.file.md5sum = descriptor.md5sum;
        std::string path = "ds" + std::to_string(descriptor.dataset_id) + "/";
        if (!descriptor.directory.empty()) {
            path += descriptor.directory + "/";
        }
        record.file.replica_uri = path + descriptor.filename;
        records_.push_back(record);
        ++staged_;
        return Ok(remote::StagedDatafile{record.file.id, record.file.replica_uri});
    }

    Result<std::int64_t> upload_datafile_with_post(const std::filesystem::path& local_path,
                                                   const remote::DatafileDescriptor& descriptor) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++post_attempts_;
        if (fail_posts_ > 0) {
            --fail_posts_;
            return Err(Error(ErrorKind::Http, "injected upload failure", 503));
        }
        std::ifstream in(local_path, std::ios::binary);
        if (!in) {
            return Err(ErrorKind::LocalIo, "Cannot open " + local_path.string());
        }
        std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

        Record record;
        record.dataset_id = descriptor.dataset_id;
        record.file.id = next_id_++;
        record.file.filename = descriptor.filename;
        record.file.directory = descriptor.directory;
        record.file.size = descriptor.size;
        record.file.md5sum = descriptor.md5sum;
        records_.push_back(record);
        posted_[record.file.id] = bytes;
        return Ok(record.file.id);
    }

    Result<void> request_verification(std::int64_t datafile_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        verifications_.push_back({datafile_id, std::chrono::steady_clock::now()});
        return Ok();
    }

    void fail_next_posts(int count) {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_posts_ = count;
    }

    void fail_next_finds(int count) {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_finds_ = count;
    }

    std::size_t lookups() const { std::lock_guard<std::mutex> lock(mutex_); return lookups_; }
    std::size_t post_attempts() const { std::lock_guard<std::mutex> lock(mutex_); return post_attempts_; }
    std::size_t staged_records() const { std::lock_guard<std::mutex> lock(mutex_); return staged_; }
    std::size_t find_calls() const { std::lock_guard<std::mutex> lock(mutex_); return find_calls_; }

    std::vector<Verification> verifications() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return verifications_;
    }

    std::map<std::int64_t, std::string> posted() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return posted_;
    }

private:
    struct Record {
        std::int64_t dataset_id = 0;
        remote::RemoteDatafile file;
    };

    mutable std::mutex mutex_;
    std::int64_t next_id_ = 1;
    std::vector<model::Owner> users_;
    std::vector<model::Owner> groups_;
    std::map<std::string, std::int64_t> experiments_;
    std::map<std::string, std::int64_t> datasets_;
    std::vector<Record> records_;
    std::map<std::int64_t, std::string> posted_;
    std::vector<Verification> verifications_;
    std::size_t lookups_ = 0;
    std::size_t post_attempts_ = 0;
    std::size_t staged_ = 0;
    std::size_t find_calls_ = 0;
    int fail_posts_ = 0;
    int fail_finds_ = 0;
};

} // namespace labsync::test_support
