#include "station_impute/core/utils.hpp"
#include "station_impute/core/errors.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <limits>
#include <locale>
#include <random>
#include <sstream>

#include <openssl/evp.h>

namespace station_impute::core {

std::string get_iso_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf;
    gmtime_r(&time_t_now, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

std::string get_run_id() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);

    std::tm tm_buf;
    localtime_r(&time_t_now, &tm_buf);

    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y%m%d_%H%M%S") << '_';

    const char* hex = "0123456789abcdef";
    for (int i = 0; i < 8; ++i) {
        oss << hex[dis(gen)];
    }

    return oss.str();
}

std::vector<fs::path> list_files(const fs::path& dir, const std::string& extension) {
    std::vector<fs::path> files;

    if (!fs::exists(dir) || !fs::is_directory(dir)) {
        return files;
    }

    const std::string ext = to_lower(extension);
    for (const auto& entry : fs::directory_iterator(dir)) {
        if (entry.is_regular_file() &&
            to_lower(entry.path().extension().string()) == ext) {
            files.push_back(entry.path());
        }
    }

    std::sort(files.begin(), files.end());
    return files;
}

std::string read_text(const fs::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw IOError("Cannot open file: " + path.string());
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

void write_text(const fs::path& path, const std::string& text) {
    ensure_parent_dir(path);
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        throw IOError("Cannot create file: " + path.string());
    }
    file << text;
    file.flush();
    if (!file) {
        throw IOError("Cannot write file: " + path.string());
    }
}

void ensure_parent_dir(const fs::path& path) {
    const fs::path parent = path.parent_path();
    if (parent.empty()) {
        return;
    }
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec) {
        throw IOError("Cannot create directory " + parent.string() + ": " + ec.message());
    }
}

std::string sha256_bytes(const std::vector<uint8_t>& data) {
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        throw StationImputeError("EVP_MD_CTX_new failed");
    }
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    bool ok = EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) == 1;
    if (ok && !data.empty()) {
        ok = EVP_DigestUpdate(ctx, data.data(), data.size()) == 1;
    }
    if (ok) {
        ok = EVP_DigestFinal_ex(ctx, hash, &hash_len) == 1;
    }
    EVP_MD_CTX_free(ctx);
    if (!ok) {
        throw StationImputeError("SHA-256 digest failed");
    }

    std::ostringstream oss;
    for (unsigned int i = 0; i < hash_len; ++i) {
        oss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(hash[i]);
    }
    return oss.str();
}

std::string sha256_text(const std::string& text) {
    return sha256_bytes(std::vector<uint8_t>(text.begin(), text.end()));
}

double round_to(double value, int decimals) {
    const double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

static std::string format_with_precision(double value, int precision) {
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss << std::setprecision(precision) << value;
    return oss.str();
}

std::string format_double(double value, int precision) {
    if (is_missing(value)) {
        return "";
    }
    if (precision > 0) {
        return format_with_precision(value, precision);
    }
    // Shortest of 15..17 significant digits that reads back to the same double
    const int max_digits = std::numeric_limits<double>::max_digits10;
    for (int p = std::numeric_limits<double>::digits10; p < max_digits; ++p) {
        const std::string text = format_with_precision(value, p);
        std::istringstream iss(text);
        iss.imbue(std::locale::classic());
        double back = 0.0;
        if ((iss >> back) && back == value) {
            return text;
        }
    }
    return format_with_precision(value, max_digits);
}

std::optional<double> parse_double(const std::string& s) {
    const std::string t = trim(s);
    if (t.empty()) {
        return std::nullopt;
    }
    const char* begin = t.c_str();
    char* end = nullptr;
    const double v = std::strtod(begin, &end);
    if (end != begin + t.size() || !std::isfinite(v)) {
        return std::nullopt;
    }
    return v;
}

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string trim(const std::string& s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    auto first = std::find_if(s.begin(), s.end(), not_space);
    auto last = std::find_if(s.rbegin(), s.rend(), not_space).base();
    return (first < last) ? std::string(first, last) : std::string();
}

} // namespace station_impute::core
