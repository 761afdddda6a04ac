#include "rft/transfer/scripts.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>

namespace rft::transfer {
namespace fs = std::filesystem;

namespace {

// Built-in bodies for the functions check_files and decode_files call.
// A <prelude_dir>/<script>.ps1 file replaces them.
const char* const kInputFunctions = R"ps(function Unresolve-Path($p) {
  if ($p -eq $null) { return $null }
  return $ExecutionContext.SessionState.Path.GetUnresolvedProviderPathFromPSPath($p)
}

function Get-MD5Sum($src) {
  if ($src -and (Test-Path $src -PathType Leaf)) {
    $md5 = New-Object -TypeName System.Security.Cryptography.MD5CryptoServiceProvider
    $in = [System.IO.File]::OpenRead($src)
    try { $bytes = $md5.ComputeHash($in) } finally { $in.Close() }
    return ([System.BitConverter]::ToString($bytes)).Replace("-", "").ToLower()
  }
  return $null
}

function Invoke-Input($hash_file) {
  $path = Unresolve-Path $hash_file
  $b64 = [System.IO.File]::ReadAllText($path) -replace '\s', ''
  $text = [System.Text.Encoding]::UTF8.GetString([System.Convert]::FromBase64String($b64))
  Remove-Item $path -Force
  return Invoke-Expression $text
}
)ps";

const char* const kCheckFunctions = R"ps(function Check-Files($h) {
  return $h.GetEnumerator() | ForEach-Object {
    $dst = Unresolve-Path $_.Value["target"]
    $exists = Test-Path $dst -PathType Leaf
    $dMd5 = if ($exists) { Get-MD5Sum $dst } else { $null }
    $dirty = $_.Key -ne $dMd5
    New-Object psobject -Property @{
      src_md5 = $_.Key
      chk_exists = $exists
      dst_md5 = $dMd5
      chk_dirty = $dirty
      verifies = -not $dirty
    }
  } | Select-Object -Property src_md5, chk_exists, dst_md5, chk_dirty, verifies
}
)ps";

const char* const kDecodeFunctions = R"ps(function Expand-ZipFile($zip, $dst) {
  Add-Type -AssemblyName System.IO.Compression.FileSystem
  if (!(Test-Path $dst)) { New-Item -ItemType Directory -Force -Path $dst | Out-Null }
  $archive = [System.IO.Compression.ZipFile]::OpenRead($zip)
  try {
    foreach ($entry in $archive.Entries) {
      $target = Join-Path $dst $entry.FullName
      if ($entry.FullName.EndsWith("/")) {
        New-Item -ItemType Directory -Force -Path $target | Out-Null
      } else {
        New-Item -ItemType Directory -Force -Path (Split-Path $target) | Out-Null
        [System.IO.Compression.ZipFileExtensions]::ExtractToFile($entry, $target, $true)
      }
    }
  } finally {
    $archive.Dispose()
  }
}

function Decode-Files($h) {
  return $h.GetEnumerator() | ForEach-Object {
    $dst = Unresolve-Path $_.Value["dst"]
    $tzip = Unresolve-Path $_.Value["tmpzip"]
    $tmp = if ($_.Key -match '^clean\d+$') { $null } else { Unresolve-Path $_.Key }
    $decoded = if ($tzip) { $tzip } else { $dst }
    $named = if ($tmp) { $tmp } else { $tzip }
    $sMd5 = [System.IO.Path]::GetFileNameWithoutExtension($named) -replace '^(b64|tmpzip)-', ''

    if ($tmp) {
      $parent = Split-Path $decoded
      if (!(Test-Path $parent)) { New-Item -ItemType Directory -Force -Path $parent | Out-Null }
      $b64 = [System.IO.File]::ReadAllText($tmp) -replace '\s', ''
      [System.IO.File]::WriteAllBytes($decoded, [System.Convert]::FromBase64String($b64))
      Remove-Item $tmp -Force
    }
    if ($tzip) { Expand-ZipFile $tzip $dst }

    $dMd5 = Get-MD5Sum $decoded
    New-Object psobject -Property @{
      dst = $dst
      verifies = $sMd5 -eq $dMd5
      src_md5 = $sMd5
      dst_md5 = $dMd5
      tmpfile = $tmp
      tmpzip = $tzip
    }
  } | Select-Object -Property dst, verifies, src_md5, dst_md5, tmpfile, tmpzip
}
)ps";

const char* const kCheckFiles = R"ps($hash_file = "{{hash_file}}"
{{prelude}}
Check-Files (Invoke-Input $hash_file) | ConvertTo-Csv -NoTypeInformation
)ps";

const char* const kDecodeFiles = R"ps($hash_file = "{{hash_file}}"
{{prelude}}
Decode-Files (Invoke-Input $hash_file) | ConvertTo-Csv -NoTypeInformation
)ps";

const char* const kChecksum = R"ps($path = "{{path}}"
{{prelude}}
$p = $ExecutionContext.SessionState.Path
$path = $p.GetUnresolvedProviderPathFromPSPath($path)
if (Test-Path $path -PathType Leaf) {
  $md5 = New-Object -TypeName System.Security.Cryptography.MD5CryptoServiceProvider
  $file = [System.IO.File]::Open($path, [System.IO.Filemode]::Open, [System.IO.FileAccess]::Read)
  ([System.BitConverter]::ToString($md5.ComputeHash($file))).Replace("-","").ToLower()
  $file.Close()
}
)ps";

const char* const kExists = R"ps($path = "{{path}}"
{{prelude}}
if (Test-Path $path) { exit 0 } else { exit 1 }
)ps";

const char* const kCreateDir = R"ps($path = "{{path}}"
{{prelude}}
$p = $ExecutionContext.SessionState.Path
$path = $p.GetUnresolvedProviderPathFromPSPath($path)
if (!(Test-Path $path)) { New-Item -ItemType Directory -Force -Path $path | Out-Null }
if (Test-Path $path -PathType Container) { exit 0 } else { exit 1 }
)ps";

const char* const kDelete = R"ps($path = "{{path}}"
{{prelude}}
if (Test-Path $path) { Remove-Item $path -Force -Recurse }
if (Test-Path $path) { exit 1 } else { exit 0 }
)ps";

const char* const kDownload = R"ps($path = "{{path}}"
{{prelude}}
$p = $ExecutionContext.SessionState.Path
$path = $p.GetUnresolvedProviderPathFromPSPath($path)
if (Test-Path $path -PathType Leaf) {
  [System.Convert]::ToBase64String([System.IO.File]::ReadAllBytes($path))
} else {
  exit 1
}
)ps";

void replace_all(std::string& text, const std::string& token, const std::string& value) {
    std::size_t pos = 0;
    while ((pos = text.find(token, pos)) != std::string::npos) {
        text.replace(pos, token.size(), value);
        pos += value.size();
    }
}

} // namespace

ScriptCatalog::ScriptCatalog(fs::path prelude_dir)
    : prelude_dir_(std::move(prelude_dir)),
      templates_{{"check_files", kCheckFiles},
                 {"decode_files", kDecodeFiles},
                 {"checksum", kChecksum},
                 {"exists", kExists},
                 {"create_dir", kCreateDir},
                 {"delete", kDelete},
                 {"download", kDownload}} {}

void ScriptCatalog::set_template(const std::string& name, std::string body) {
    templates_[name] = std::move(body);
}

bool ScriptCatalog::contains(const std::string& name) const {
    return templates_.find(name) != templates_.end();
}

std::string ScriptCatalog::default_prelude(const std::string& name) {
    if (name == "check_files") {
        return std::string(kInputFunctions) + "\n" + kCheckFunctions;
    }
    if (name == "decode_files") {
        return std::string(kInputFunctions) + "\n" + kDecodeFunctions;
    }
    return {};
}

Result<std::string> ScriptCatalog::load_prelude(const std::string& name) const {
    if (prelude_dir_.empty()) {
        return Ok(default_prelude(name));
    }

    const fs::path file = prelude_dir_ / (name + ".ps1");
    if (!fs::exists(file)) {
        return Ok(default_prelude(name));
    }

    std::ifstream input(file, std::ios::binary);
    if (!input) {
        return Err<std::string>(ErrorKind::InvalidConfig, "Failed to read script prelude: " + file.string());
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return Ok(buffer.str());
}

Result<std::string> ScriptCatalog::render(const std::string& name,
                                          const std::map<std::string, std::string>& variables) const {
    const auto it = templates_.find(name);
    if (it == templates_.end()) {
        return Err<std::string>(ErrorKind::InvalidConfig, "Unknown remote script: " + name);
    }

    auto prelude = load_prelude(name);
    if (prelude.is_error()) {
        return prelude;
    }

    std::string script = it->second;
    replace_all(script, "{{prelude}}", prelude.value());
    for (const auto& [key, value] : variables) {
        replace_all(script, "{{" + key + "}}", value);
    }

    const auto unbound = script.find("{{");
    if (unbound != std::string::npos) {
        const auto end = script.find("}}", unbound);
        return Err<std::string>(ErrorKind::InvalidConfig,
                                "Unbound placeholder " + script.substr(unbound, end == std::string::npos
                                                                                   ? std::string::npos
                                                                                   : end - unbound + 2) +
                                " in script " + name);
    }

    spdlog::debug("Rendered remote script {} ({} bytes)", name, script.size());
    return Ok(std::move(script));
}

} // namespace rft::transfer
