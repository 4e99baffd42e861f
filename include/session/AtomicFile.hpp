#pragma once
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>
#include "errors.hpp"

namespace reviewer {
namespace fs = std::filesystem;

// Whole-file replacement through a sibling temp file and rename(2).
// Readers see either the old content or the new, never a partial write.
class AtomicFile {
public:
    static void write(const fs::path& target, const std::string& content) {
        fs::path tmp = target;
        tmp += ".tmp." + std::to_string(::getpid());

        {
            std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
            if (!out) {
                throw ReviewerError(ErrorCode::IoError, "Cannot open " + tmp.string() + " for writing");
            }
            out.write(content.data(), static_cast<std::streamsize>(content.size()));
            out.flush();
            if (!out) {
                discard(tmp);
                throw ReviewerError(ErrorCode::IoError, "Short write to " + tmp.string());
            }
        }

        std::error_code ec;
        fs::rename(tmp, target, ec);
        if (ec) {
            discard(tmp);
            throw ReviewerError(ErrorCode::IoError, "Cannot replace " + target.string() + ": " + ec.message());
        }
    }

    static std::string read(const fs::path& target) {
        std::ifstream in(target, std::ios::binary);
        if (!in) {
            throw ReviewerError(ErrorCode::NotFound, "Cannot open " + target.string());
        }
        return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    }

private:
    static void discard(const fs::path& tmp) {
        std::error_code ec;
        fs::remove(tmp, ec);
    }
};

} // namespace reviewer
