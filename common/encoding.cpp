// ============================================================
// encoding.cpp -- Filename text encodings (iconv)
// ============================================================

#include "encoding.hpp"
#include "errors.hpp"
#include <vector>
#include <langinfo.h>

using namespace encoding;

static const iconv_t BAD_ICONV = (iconv_t)-1;

// UTF-8 form of escape code point U+DC00 + b
static void append_escape(std::string& out, u8 b) {
    u32 cp = 0xDC00u + b;
    out.push_back((char)(0xE0 | (cp >> 12)));
    out.push_back((char)(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back((char)(0x80 | (cp & 0x3F)));
}

// If text[i..] starts an escape sequence, store the raw byte and return true
static bool take_escape(const std::string& text, size_t i, u8& raw) {
    if (i + 2 >= text.size()) return false;
    u8 b0 = (u8)text[i], b1 = (u8)text[i + 1], b2 = (u8)text[i + 2];
    if (b0 != 0xED || (b1 & 0xC0) != 0x80 || (b2 & 0xC0) != 0x80) return false;
    u32 cp = ((u32)(b0 & 0x0F) << 12) | ((u32)(b1 & 0x3F) << 6) | (u32)(b2 & 0x3F);
    if (cp < 0xDC00 || cp > 0xDCFF) return false;
    raw = (u8)(cp - 0xDC00);
    return true;
}

// ============================================================
// Codec
// ============================================================

Codec::Codec(const std::string& charset)
    : charset_(charset)
    , to_text_(::iconv_open("UTF-8", charset.c_str()))
    , to_raw_(BAD_ICONV)
{
    if (to_text_ == BAD_ICONV) {
        throw ConfigurationError("unknown text encoding: " + charset);
    }
    to_raw_ = ::iconv_open(charset.c_str(), "UTF-8");
    if (to_raw_ == BAD_ICONV) {
        ::iconv_close(to_text_);
        throw ConfigurationError("unknown text encoding: " + charset);
    }
}

Codec::~Codec() {
    ::iconv_close(to_text_);
    ::iconv_close(to_raw_);
}

std::string Codec::convert(iconv_t cd, const std::string& in, bool escape_invalid) const {
    ::iconv(cd, nullptr, nullptr, nullptr, nullptr);

    std::string out;
    std::vector<char> buf(in.size() * 4 + 16);
    char*  inp    = const_cast<char*>(in.data());
    size_t inleft = in.size();

    while (inleft > 0) {
        char*  outp    = buf.data();
        size_t outleft = buf.size();
        size_t rc = ::iconv(cd, &inp, &inleft, &outp, &outleft);
        int err = errno;
        out.append(buf.data(), buf.size() - outleft);
        if (rc != (size_t)-1) break;
        if (err == E2BIG) continue;
        if (err != EILSEQ && err != EINVAL) {
            throw KernelResourceError("iconv", err);
        }
        if (!escape_invalid) {
            throw PathError(in, EILSEQ);
        }
        append_escape(out, (u8)*inp);
        ++inp;
        --inleft;
        ::iconv(cd, nullptr, nullptr, nullptr, nullptr);
    }

    // Flush any pending shift sequence
    char*  outp    = buf.data();
    size_t outleft = buf.size();
    ::iconv(cd, nullptr, nullptr, &outp, &outleft);
    out.append(buf.data(), buf.size() - outleft);
    return out;
}

std::string Codec::decode(const std::string& raw) const {
    std::lock_guard<std::mutex> lk(mutex_);
    return convert(to_text_, raw, true);
}

std::string Codec::encode(const std::string& text) const {
    std::lock_guard<std::mutex> lk(mutex_);

    std::string out;
    std::string run;
    size_t i = 0;
    while (i < text.size()) {
        u8 raw = 0;
        if (take_escape(text, i, raw)) {
            if (!run.empty()) {
                out += convert(to_raw_, run, false);
                run.clear();
            }
            out.push_back((char)raw);
            i += 3;
            continue;
        }
        run.push_back(text[i]);
        ++i;
    }
    if (!run.empty()) out += convert(to_raw_, run, false);
    return out;
}

// ============================================================
// Utility functions
// ============================================================

std::string encoding::locale_charset() {
    const char* cs = ::nl_langinfo(CODESET);
    if (!cs || !*cs) return "UTF-8";
    std::string name(cs);
    // The POSIX locale reports ASCII; treat it as UTF-8 like modern tools do
    if (name == "ANSI_X3.4-1968" || name == "ASCII") return "UTF-8";
    return name;
}
