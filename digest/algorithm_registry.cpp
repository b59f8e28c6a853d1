// ============================================================
// algorithm_registry.cpp -- Known digest algorithms
// ============================================================

#include "algorithm_registry.hpp"
#include "../common/errors.hpp"
#include "../common/logger.hpp"
#include <cctype>
#include <cstdlib>
#include <fstream>

using namespace digest;

namespace {

struct StaticEntry {
    const char* name;
    const char* kernel_name;
    size_t      digest_size;
    bool        key_required;
    Backend     backend;
};

const StaticEntry STATIC_TABLE[] = {
    { "dummy",       "",             0,  false, Backend::Null      },
    { "xxh3_128",    "",             16, false, Backend::Userspace },
    { "crc32c",      "crc32c",       4,  false, Backend::Kernel    },
    { "md5",         "md5",          16, false, Backend::Kernel    },
    { "sha1",        "sha1",         20, false, Backend::Kernel    },
    { "sha224",      "sha224",       28, false, Backend::Kernel    },
    { "sha256",      "sha256",       32, false, Backend::Kernel    },
    { "sha384",      "sha384",       48, false, Backend::Kernel    },
    { "sha512",      "sha512",       64, false, Backend::Kernel    },
    { "hmac_sha1",   "hmac(sha1)",   20, true,  Backend::Kernel    },
    { "hmac_sha256", "hmac(sha256)", 32, true,  Backend::Kernel    },
};

const char* const KEYED_PREFIXES[] = { "hmac(", "cmac(", "xcbc(", "vmac" };

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r");
    return s.substr(b, e - b + 1);
}

bool needs_key(const std::string& kernel_name) {
    for (const char* p : KEYED_PREFIXES) {
        if (kernel_name.compare(0, std::char_traits<char>::length(p), p) == 0) return true;
    }
    return false;
}

} // namespace

// ============================================================
// AlgorithmRegistry
// ============================================================

const AlgorithmRegistry& AlgorithmRegistry::instance() {
    static const AlgorithmRegistry registry = [] {
        AlgorithmRegistry r;
        std::ifstream in("/proc/crypto");
        if (in) {
            r.load_proc_crypto(in);
        } else {
            LOG_DEBUG("/proc/crypto not readable; using built-in algorithm table");
        }
        return r;
    }();
    return registry;
}

AlgorithmRegistry::AlgorithmRegistry() {
    for (const auto& e : STATIC_TABLE) {
        add({ e.name, e.kernel_name, e.digest_size, e.key_required, e.backend });
    }
}

void AlgorithmRegistry::add(AlgorithmDescriptor desc) {
    std::string key = desc.name;
    table_.emplace(std::move(key), std::move(desc));
}

void AlgorithmRegistry::load_proc_crypto(std::istream& in) {
    std::map<std::string, std::string> block;

    auto flush = [&] {
        auto type   = block.find("type");
        auto driver = block.find("driver");
        auto size   = block.find("digestsize");
        if (type != block.end() && type->second == "shash" &&
            driver != block.end() && size != block.end())
        {
            AlgorithmDescriptor desc;
            desc.name         = driver_to_name(driver->second);
            desc.kernel_name  = driver->second;
            desc.digest_size  = (size_t)std::strtoul(size->second.c_str(), nullptr, 10);
            desc.key_required = needs_key(driver->second);
            desc.backend      = Backend::Kernel;
            if (!desc.name.empty() && table_.find(desc.name) == table_.end()) {
                add(std::move(desc));
            }
        }
        block.clear();
    };

    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty()) {
            flush();
            continue;
        }
        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;
        block[trim(line.substr(0, colon))] = trim(line.substr(colon + 1));
    }
    flush();
}

const AlgorithmDescriptor* AlgorithmRegistry::find(const std::string& name) const {
    auto it = table_.find(name);
    return it == table_.end() ? nullptr : &it->second;
}

const AlgorithmDescriptor& AlgorithmRegistry::at(const std::string& name) const {
    const AlgorithmDescriptor* desc = find(name);
    if (!desc) {
        throw ConfigurationError("unknown digest algorithm: " + name);
    }
    return *desc;
}

std::vector<std::string> AlgorithmRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(table_.size());
    for (const auto& kv : table_) out.push_back(kv.first);
    return out;
}

// ============================================================
// Utility functions
// ============================================================

std::string digest::driver_to_name(const std::string& driver) {
    std::string name = driver;
    for (char& c : name) {
        if (std::ispunct((unsigned char)c)) c = '_';
    }

    size_t b = name.find_first_not_of('_');
    if (b == std::string::npos) return "";
    size_t e = name.find_last_not_of('_');
    name = name.substr(b, e - b + 1);

    static const std::string SUFFIX = "_generic";
    if (name.size() > SUFFIX.size() &&
        name.compare(name.size() - SUFFIX.size(), SUFFIX.size(), SUFFIX) == 0)
    {
        name.resize(name.size() - SUFFIX.size());
    }
    return name;
}
