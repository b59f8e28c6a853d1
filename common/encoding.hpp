#pragma once

// ============================================================
// encoding.hpp -- Filename text encodings (iconv)
//
// Names are carried internally as UTF-8 text. A Codec converts
// raw on-disk name bytes to text and back. Bytes the charset
// cannot decode are kept as escape code points U+DC80..U+DCFF
// so encode(decode(x)) == x for any x.
// ============================================================

#include "platform.hpp"
#include <string>
#include <mutex>
#include <iconv.h>

namespace encoding {

class Codec {
public:
    // Throws ConfigurationError if iconv does not know the charset
    explicit Codec(const std::string& charset);
    ~Codec();

    Codec(const Codec&) = delete;
    Codec& operator=(const Codec&) = delete;

    const std::string& name() const { return charset_; }

    // Raw bytes -> UTF-8 text; never fails
    std::string decode(const std::string& raw) const;

    // UTF-8 text -> raw bytes; throws PathError(EILSEQ) for characters
    // the charset cannot represent
    std::string encode(const std::string& text) const;

private:
    std::string convert(iconv_t cd, const std::string& in, bool escape_invalid) const;

    std::string        charset_;
    iconv_t            to_text_;
    iconv_t            to_raw_;
    mutable std::mutex mutex_;
};

// Codeset of the current LC_CTYPE locale, "UTF-8" if unset
std::string locale_charset();

} // namespace encoding
