#pragma once

// ============================================================
// hash_app.hpp -- lehash: print kernel digests of files
// ============================================================

#include "../common/platform.hpp"
#include "digester.hpp"
#include <optional>
#include <ostream>
#include <string>
#include <vector>

struct HashConfig {
    std::vector<std::string>   files;
    std::string                algorithm{"md5"};
    std::optional<std::string> key;
    size_t                     threads{platform::cpu_count()};
};

class HashApp {
public:
    explicit HashApp(HashConfig config, std::ostream& out);

    // Prints "<hex>  <path>" per file in argument order.
    // 0 if every file was digested, 1 otherwise.
    int run();

private:
    HashConfig    config_;
    std::ostream& out_;
};

// Digest one file under a shared, non-blocking lock
digest::Digest digest_file(const digest::Digester& digester, const std::string& path);
