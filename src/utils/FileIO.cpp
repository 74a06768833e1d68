#include "utils/FileIO.hpp"
#include <openssl/evp.h>
#include <atomic>
#include <chrono>
#include <cerrno>
#include <cstring>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <fcntl.h>
#include <unistd.h>

namespace autopatch {

namespace fs = std::filesystem;

std::string read_file_bytes(const fs::path& path) {
    std::ifstream f(path, std::ios::in | std::ios::binary);
    if (!f.is_open()) {
        throw std::runtime_error("Cannot open " + path.string() + " for reading");
    }
    std::stringstream buffer;
    buffer << f.rdbuf();
    if (f.bad()) {
        throw std::runtime_error("Read error on " + path.string());
    }
    return buffer.str();
}

void write_file_atomic(const fs::path& target, const std::string& data) {
    static std::atomic<unsigned> counter{0};

    fs::path dir = target.parent_path();
    fs::path tmp = dir / ("." + target.filename().string() + ".autopatch-tmp-" +
                          std::to_string(::getpid()) + "-" + std::to_string(counter++));

    int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw std::runtime_error("Cannot create " + tmp.string() + ": " + std::strerror(errno));
    }

    auto fail = [&](const std::string& what) {
        int saved = errno;
        ::close(fd);
        std::error_code ec;
        fs::remove(tmp, ec);
        throw std::runtime_error(what + " " + target.string() + ": " + std::strerror(saved));
    };

    const char* p = data.data();
    size_t left = data.size();
    while (left > 0) {
        ssize_t n = ::write(fd, p, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            fail("Write failed for");
        }
        p += n;
        left -= static_cast<size_t>(n);
    }
    if (::fsync(fd) != 0) fail("fsync failed for");
    if (::close(fd) != 0) {
        std::error_code ec;
        fs::remove(tmp, ec);
        throw std::runtime_error("close failed for " + target.string());
    }

    std::error_code ec;
    fs::rename(tmp, target, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throw std::runtime_error("Rename into " + target.string() + " failed: " + ec.message());
    }
}

std::string sha256_hex(const std::string& data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_Digest(data.data(), data.size(), digest, &len, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("SHA-256 digest failed");
    }
    std::ostringstream ss;
    for (unsigned int i = 0; i < len; ++i) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
    }
    return ss.str();
}

long long now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string utc_stamp() {
    long long ms = now_ms();
    std::time_t secs = static_cast<std::time_t>(ms / 1000);
    std::tm tm_utc{};
    gmtime_r(&secs, &tm_utc);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y%m%dT%H%M%S", &tm_utc);
    std::ostringstream ss;
    ss << buf << std::setw(3) << std::setfill('0') << (ms % 1000) << "Z";
    return ss.str();
}

}
