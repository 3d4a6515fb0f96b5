#include "corelay/storage.hpp"
#include "corelay/codec.hpp"
#include "corelay/log.hpp"

#include <algorithm>
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace corelay {

using json = nlohmann::ordered_json;

namespace {

// Largest record payload accepted on write and on load
constexpr uint32_t max_record_size = 1u << 28;

// Record framing: 4-byte big-endian length, then the payload
bool write_length_prefixed(int fd, const void* data, uint32_t length) {
    uint32_t net_len = htonl(length);
    const uint8_t* hdr = reinterpret_cast<const uint8_t*>(&net_len);

    // Header and payload go out in one buffer so an O_APPEND write lands whole
    std::vector<uint8_t> frame(hdr, hdr + 4);
    const uint8_t* payload = static_cast<const uint8_t*>(data);
    frame.insert(frame.end(), payload, payload + length);

    size_t written = 0;
    while (written < frame.size()) {
        ssize_t n = ::write(fd, frame.data() + written, frame.size() - written);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        written += static_cast<size_t>(n);
    }
    return true;
}

enum class read_status { ok, eof, truncated };

read_status read_length_prefixed(int fd, std::vector<uint8_t>& out) {
    uint32_t net_len = 0;
    uint8_t* hdr = reinterpret_cast<uint8_t*>(&net_len);
    size_t received = 0;
    while (received < 4) {
        ssize_t n = ::read(fd, hdr + received, 4 - received);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return received == 0 ? read_status::eof : read_status::truncated;
        received += static_cast<size_t>(n);
    }

    uint32_t length = ntohl(net_len);
    if (length == 0 || length > max_record_size) return read_status::truncated;

    out.assign(length, 0);
    received = 0;
    while (received < length) {
        ssize_t n = ::read(fd, out.data() + received, length - received);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return read_status::truncated;
        received += static_cast<size_t>(n);
    }
    return read_status::ok;
}

} // namespace

struct append_log_storage::log_file {
    int fd = -1;
    std::string path;
    open_mode mode = open_mode::read;
    bool loaded = false;
    std::map<std::string, value> records;

    ~log_file() {
        if (fd >= 0) ::close(fd);
    }

    void load() {
        if (::lseek(fd, 0, SEEK_SET) < 0) {
            throw storage_error("Failed to rewind " + path + ": " + std::strerror(errno));
        }

        std::vector<uint8_t> payload;
        std::size_t count = 0;
        off_t good_end = 0;
        read_status status;
        while ((status = read_length_prefixed(fd, payload)) == read_status::ok) {
            try {
                json record = json::from_msgpack(payload);
                records[record.at("key").get<std::string>()] = codec::decode(record.at("data"));
            } catch (const nlohmann::json::exception& e) {
                throw storage_error("Corrupt record in " + path + ": " + e.what());
            }
            good_end += static_cast<off_t>(4 + payload.size());
            ++count;
        }
        if (status == read_status::truncated) {
            LOG_WARN("append_log", "%s: ignoring truncated record after %zu records", path.c_str(), count);
            // Appending behind a torn record would misframe everything after it
            if (mode != open_mode::read && ::ftruncate(fd, good_end) < 0) {
                throw storage_error("Failed to drop the truncated tail of " + path + ": " +
                                    std::strerror(errno));
            }
        }
        LOG_DEBUG("append_log", "%s: loaded %zu records", path.c_str(), count);
        loaded = true;
    }
};

append_log_storage::append_log_storage(const std::string& path, open_mode mode, const kwargs_t& kwargs)
    : log_(std::make_shared<log_file>()) {
    assign_arguments({}, kwargs);

    int flags = O_CLOEXEC;
    switch (mode) {
        case open_mode::read: flags |= O_RDONLY; break;
        case open_mode::write: flags |= O_RDWR | O_CREAT | O_TRUNC | O_APPEND; break;
        case open_mode::append: flags |= O_RDWR | O_CREAT | O_APPEND; break;
    }

    log_->path = path;
    log_->mode = mode;
    log_->fd = ::open(path.c_str(), flags, 0644);
    if (log_->fd < 0) {
        std::string error = std::strerror(errno);
        LOG_ERROR("append_log", "Failed to open %s: %s", path.c_str(), error.c_str());
        throw storage_error("Failed to open " + path + ": " + error);
    }
    LOG_INFO("append_log", "opened %s", path.c_str());
}

append_log_storage::log_file& append_log_storage::log() const {
    if (!log_ || log_->fd < 0) {
        throw storage_error("Append log storage is closed.");
    }
    return *log_;
}

value append_log_storage::read(const value&, const mapping_t&) {
    // exists() loads the log on first use
    if (!exists()) {
        throw no_data_source("Key: '" + get_as<std::string>("data_key") + "' does not exist.");
    }
    return log().records.at(get_as<std::string>("data_key"));
}

void append_log_storage::write(const value& output, const value&, const mapping_t&) {
    log_file& file = log();
    if (file.mode == open_mode::read) {
        throw no_data_target("Append log " + file.path + " is opened read-only.");
    }

    // The tail is checked before the first append
    if (!file.loaded) {
        file.load();
    }

    std::string key = get_as<std::string>("data_key");
    json record = json::object();
    record["key"] = key;
    record["data"] = codec::encode(output);
    std::vector<uint8_t> payload = json::to_msgpack(record);
    if (payload.size() > max_record_size) {
        throw storage_error("Record '" + key + "' of " + std::to_string(payload.size()) +
                            " bytes exceeds the append log limit of " +
                            std::to_string(max_record_size) + " bytes.");
    }

    if (!write_length_prefixed(file.fd, payload.data(), static_cast<uint32_t>(payload.size()))) {
        std::string error = std::strerror(errno);
        LOG_ERROR("append_log", "Failed to append to %s: %s", file.path.c_str(), error.c_str());
        throw storage_error("Failed to append to " + file.path + ": " + error);
    }
    file.records[key] = output;
}

bool append_log_storage::exists() {
    auto all = keys();
    std::string key = get_as<std::string>("data_key");
    return std::find(all.begin(), all.end(), key) != all.end();
}

std::vector<std::string> append_log_storage::keys() {
    log_file& file = log();
    if (!file.loaded) {
        file.load();
    }
    std::vector<std::string> result;
    result.reserve(file.records.size());
    for (const auto& entry : file.records) {
        result.push_back(entry.first);
    }
    return result;
}

void append_log_storage::close() {
    if (log_ && log_->fd >= 0) {
        ::close(log_->fd);
        log_->fd = -1;
        LOG_INFO("append_log", "closed %s", log_->path.c_str());
    }
}

bool append_log_storage::is_open() const {
    return log_ && log_->fd >= 0;
}

} // namespace corelay
