#pragma once

#include "rft/core/result.hpp"

#include <filesystem>
#include <map>
#include <string>

namespace rft::transfer {

/**
 * @brief Named PowerShell script templates run on the remote side
 *
 * A template is plain text with {{name}} placeholders. {{prelude}} is
 * replaced by <prelude_dir>/<script>.ps1 when that file exists, otherwise by
 * the built-in default_prelude(), which defines Invoke-Input, Check-Files and
 * Decode-Files for check_files and decode_files. A deployment prelude must
 * define the same functions. The engine only relies on each script's input
 * variables and its CSV output.
 *
 * Built-in scripts:
 *   check_files   hash_file  -> CSV src_md5,chk_exists,dst_md5,chk_dirty,verifies
 *   decode_files  hash_file  -> CSV dst,verifies,src_md5,dst_md5,tmpfile,tmpzip
 *   checksum      path       -> MD5 hex of the file, or nothing
 *   exists        path       -> exit code 0 when present
 *   create_dir    path       -> exit code 0 on success
 *   delete        path       -> exit code 0 on success
 *   download      path       -> base64 of the file on stdout
 */
class ScriptCatalog {
public:
    explicit ScriptCatalog(std::filesystem::path prelude_dir = {});

    Result<std::string> render(const std::string& name,
                               const std::map<std::string, std::string>& variables) const;

    void set_template(const std::string& name, std::string body);

    [[nodiscard]] bool contains(const std::string& name) const;

    /// Function definitions used when no prelude file is configured for name.
    static std::string default_prelude(const std::string& name);

private:
    Result<std::string> load_prelude(const std::string& name) const;

    std::filesystem::path prelude_dir_;
    std::map<std::string, std::string> templates_;
};

} // namespace rft::transfer
