#include "LocalPane.h"

#include <algorithm>
#include <memory>

#include <gio/gio.h>

#include <wx/log.h>

namespace {
constexpr const char* kListAttributes = "standard::name,standard::type,standard::size,time::modified";

struct GObjectUnref {
  void operator()(gpointer p) const {
    if (p) g_object_unref(p);
  }
};

template <typename T>
using GObjectPtr = std::unique_ptr<T, GObjectUnref>;

struct GErrorFree {
  void operator()(GError* e) const {
    if (e) g_error_free(e);
  }
};

using GErrorPtr = std::unique_ptr<GError, GErrorFree>;

struct GCharsFree {
  void operator()(char* s) const { g_free(s); }
};

using GCharsPtr = std::unique_ptr<char, GCharsFree>;

ErrorKind KindFromGError(const GError* err) {
  if (!err || err->domain != G_IO_ERROR) return ErrorKind::Unexpected;
  switch (err->code) {
    case G_IO_ERROR_NOT_FOUND:
      return ErrorKind::NotFound;
    case G_IO_ERROR_PERMISSION_DENIED:
    case G_IO_ERROR_READ_ONLY:
      return ErrorKind::PermissionDenied;
    case G_IO_ERROR_EXISTS:
      return ErrorKind::AlreadyExists;
    case G_IO_ERROR_INVALID_DATA:
    case G_IO_ERROR_INVALID_FILENAME:
    case G_IO_ERROR_FILENAME_TOO_LONG:
      return ErrorKind::InvalidData;
    case G_IO_ERROR_PARTIAL_INPUT:
      return ErrorKind::IncompleteTransfer;
    case G_IO_ERROR_NOT_SUPPORTED:
    case G_IO_ERROR_IS_DIRECTORY:
    case G_IO_ERROR_NOT_DIRECTORY:
    case G_IO_ERROR_NOT_REGULAR_FILE:
      return ErrorKind::Unsupported;
    default:
      return ErrorKind::Unexpected;
  }
}

OpResult FromGError(const GError* err, const char* fallback) {
  const auto kind = KindFromGError(err);
  return Failure(LocalPane::kDomain, kind, ErrorKindName(kind),
                 (err && err->message) ? err->message : fallback);
}

OpResult LocalFailure(ErrorKind kind, std::string message) {
  return Failure(LocalPane::kDomain, kind, ErrorKindName(kind), std::move(message));
}

GObjectPtr<GFile> MakeFile(const std::string& location) {
  return GObjectPtr<GFile>(g_file_new_for_commandline_arg(location.c_str()));
}

GObjectPtr<GFile> ChildFile(const std::string& dir, std::string name) {
  while (EndsWith(name, '/')) name.pop_back();
  const auto parent = MakeFile(dir);
  return GObjectPtr<GFile>(g_file_get_child(parent.get(), name.c_str()));
}

std::string LocationOf(GFile* file) {
  if (g_file_is_native(file)) {
    GCharsPtr path(g_file_get_path(file));
    if (path) return path.get();
  }
  GCharsPtr uri(g_file_get_uri(file));
  return uri ? std::string(uri.get()) : std::string();
}

std::string DisplayName(GFile* file) {
  GCharsPtr name(g_file_get_parse_name(file));
  return name ? std::string(name.get()) : std::string();
}

EntryKind KindFromFileType(GFileType type) {
  switch (type) {
    case G_FILE_TYPE_DIRECTORY: return EntryKind::Directory;
    case G_FILE_TYPE_REGULAR: return EntryKind::File;
    // FIFOs and device nodes may never reach end of stream.
    default: return EntryKind::Unknown;
  }
}

class GioInputStream final : public ByteStream {
public:
  GioInputStream(GObjectPtr<GFileInputStream> in, std::optional<std::uint64_t> size, std::string label)
      : in_(std::move(in)), size_(size), label_(std::move(label)) {}

  std::optional<std::uint64_t> Size() const override { return size_; }

  OpResult Read(std::vector<char>& chunk, std::size_t maxBytes) override {
    chunk.resize(maxBytes);
    GError* raw = nullptr;
    const gssize n = g_input_stream_read(G_INPUT_STREAM(in_.get()), chunk.data(), maxBytes, nullptr, &raw);
    if (n < 0) {
      GErrorPtr err(raw);
      chunk.clear();
      return FromGError(err.get(), "Read failed.");
    }
    chunk.resize(static_cast<std::size_t>(n));
    bytesRead_ += static_cast<std::uint64_t>(n);

    if (n == 0 && size_ && bytesRead_ < *size_) {
      return LocalFailure(ErrorKind::IncompleteTransfer,
                          "(File: " + label_ + ") ended after " + std::to_string(bytesRead_) + " of " +
                              std::to_string(*size_) + " bytes");
    }
    return Success();
  }

private:
  GObjectPtr<GFileInputStream> in_;
  std::optional<std::uint64_t> size_;
  std::string label_;
  std::uint64_t bytesRead_{0};
};

// Closes an unfinished output stream through a cancelled cancellable so GIO
// drops its replacement temp file, and removes a file created from scratch.
void DiscardOutput(GFile* file, GOutputStream* out, bool existedBefore) {
  GObjectPtr<GCancellable> cancellable(g_cancellable_new());
  g_cancellable_cancel(cancellable.get());

  GError* raw = nullptr;
  if (!g_output_stream_close(out, cancellable.get(), &raw)) {
    GErrorPtr err(raw);
    wxLogDebug("Discarded partial output: %s", err ? err->message : "closed");
  }
  if (existedBefore) return;

  raw = nullptr;
  if (!g_file_delete(file, nullptr, &raw)) {
    GErrorPtr err(raw);
    if (!g_error_matches(err.get(), G_IO_ERROR, G_IO_ERROR_NOT_FOUND)) {
      wxLogWarning("Unable to remove partial file %s: %s",
                   wxString::FromUTF8(DisplayName(file)),
                   err ? err->message : "unknown error");
    }
  }
}
}  // namespace

LocalPane::LocalPane(const std::string& startLocation) : StoragePane([&startLocation]() {
  if (startLocation.empty()) {
    GCharsPtr cwd(g_get_current_dir());
    return std::string(cwd.get());
  }
  const auto file = MakeFile(startLocation);
  return LocationOf(file.get());
}()) {}

std::string LocalPane::ResourceLabel() const {
  const char* user = g_get_user_name();
  return user ? user : "";
}

OpResult LocalPane::ListLocation(const std::string& location, std::vector<Entry>& out) {
  const auto dir = MakeFile(location);

  GError* raw = nullptr;
  GObjectPtr<GFileEnumerator> en(
      g_file_enumerate_children(dir.get(), kListAttributes, G_FILE_QUERY_INFO_NONE, nullptr, &raw));
  if (!en) {
    GErrorPtr err(raw);
    if (g_error_matches(err.get(), G_IO_ERROR, G_IO_ERROR_NOT_DIRECTORY)) {
      return LocalFailure(ErrorKind::Unsupported, "Given path points to a non-directory file: " + location);
    }
    return FromGError(err.get(), "Unable to enumerate directory.");
  }

  std::vector<Entry> entries;
  for (;;) {
    GError* nextRaw = nullptr;
    GObjectPtr<GFileInfo> info(g_file_enumerator_next_file(en.get(), nullptr, &nextRaw));
    if (!info) {
      if (nextRaw) {
        GErrorPtr err(nextRaw);
        return FromGError(err.get(), "Unable to enumerate directory.");
      }
      break;
    }

    const char* name = g_file_info_get_name(info.get());
    if (!name || !*name) continue;

    Entry e;
    e.name = name;
    e.kind = KindFromFileType(g_file_info_get_file_type(info.get()));
    if (e.kind == EntryKind::Directory) {
      e.name.push_back('/');
    } else if (g_file_info_has_attribute(info.get(), G_FILE_ATTRIBUTE_STANDARD_SIZE)) {
      e.size = static_cast<std::uint64_t>(g_file_info_get_size(info.get()));
    }
    if (g_file_info_has_attribute(info.get(), G_FILE_ATTRIBUTE_TIME_MODIFIED)) {
      e.modified = static_cast<std::int64_t>(
          g_file_info_get_attribute_uint64(info.get(), G_FILE_ATTRIBUTE_TIME_MODIFIED));
    }
    entries.push_back(std::move(e));
  }

  raw = nullptr;
  if (!g_file_enumerator_close(en.get(), nullptr, &raw)) {
    GErrorPtr err(raw);
    wxLogDebug("Closing enumerator for %s: %s", wxString::FromUTF8(location), err ? err->message : "failed");
  }

  // Folders first, then by name.
  std::sort(entries.begin(), entries.end(), [](const Entry& a, const Entry& b) {
    const bool aDir = a.kind == EntryKind::Directory;
    const bool bDir = b.kind == EntryKind::Directory;
    if (aDir != bDir) return aDir;
    return a.name < b.name;
  });

  out = std::move(entries);
  return Success();
}

std::optional<std::string> LocalPane::ChildLocation(const std::string& location, const Entry& entry) const {
  if (entry.kind != EntryKind::Directory) return std::nullopt;
  const auto child = ChildFile(location, entry.name);
  return LocationOf(child.get());
}

std::optional<std::string> LocalPane::ParentLocation(const std::string& location) const {
  const auto file = MakeFile(location);
  GObjectPtr<GFile> parent(g_file_get_parent(file.get()));
  if (!parent) return std::nullopt;
  return LocationOf(parent.get());
}

StreamResult LocalPane::OpenRead(const std::string& dir, const std::string& name) {
  const auto file = ChildFile(dir, name);

  GError* raw = nullptr;
  GObjectPtr<GFileInputStream> in(g_file_read(file.get(), nullptr, &raw));
  if (!in) {
    GErrorPtr err(raw);
    return {.status = FromGError(err.get(), "Unable to open file.")};
  }

  std::optional<std::uint64_t> size;
  raw = nullptr;
  GObjectPtr<GFileInfo> info(
      g_file_input_stream_query_info(in.get(), G_FILE_ATTRIBUTE_STANDARD_SIZE, nullptr, &raw));
  if (info) {
    size = static_cast<std::uint64_t>(g_file_info_get_size(info.get()));
  } else {
    GErrorPtr err(raw);
    wxLogDebug("Size of %s unknown: %s", wxString::FromUTF8(name), err ? err->message : "no info");
  }

  return {.status = Success(),
          .stream = std::make_unique<GioInputStream>(std::move(in), size, DisplayName(file.get()))};
}

OpResult LocalPane::Write(const std::string& dir, const std::string& name, ByteStream& stream) {
  const auto file = ChildFile(dir, name);
  const bool existed = g_file_query_exists(file.get(), nullptr);

  GError* raw = nullptr;
  GObjectPtr<GFileOutputStream> out(
      g_file_replace(file.get(), nullptr, FALSE, G_FILE_CREATE_NONE, nullptr, &raw));
  if (!out) {
    GErrorPtr err(raw);
    return FromGError(err.get(), "Unable to create file.");
  }
  auto* os = G_OUTPUT_STREAM(out.get());

  const auto expected = stream.Size();
  std::uint64_t total = 0;
  std::vector<char> chunk;
  for (;;) {
    auto res = stream.Read(chunk, kStreamChunkSize);
    if (!res.ok) {
      DiscardOutput(file.get(), os, existed);
      return res;
    }
    if (chunk.empty()) break;

    gsize written = 0;
    raw = nullptr;
    if (!g_output_stream_write_all(os, chunk.data(), chunk.size(), &written, nullptr, &raw)) {
      GErrorPtr err(raw);
      DiscardOutput(file.get(), os, existed);
      return FromGError(err.get(), "Write failed.");
    }
    total += written;
  }

  if (expected && total != *expected) {
    DiscardOutput(file.get(), os, existed);
    return LocalFailure(ErrorKind::IncompleteTransfer,
                        "(File: " + DisplayName(file.get()) + ") wrote " + std::to_string(total) + " of " +
                            std::to_string(*expected) + " bytes");
  }

  raw = nullptr;
  if (!g_output_stream_close(os, nullptr, &raw)) {
    GErrorPtr err(raw);
    return FromGError(err.get(), "Unable to finish writing file.");
  }
  return Success();
}

OpResult LocalPane::Remove(const std::string& dir, const std::string& name) {
  const auto file = ChildFile(dir, name);

  const auto type = g_file_query_file_type(file.get(), G_FILE_QUERY_INFO_NOFOLLOW_SYMLINKS, nullptr);
  if (type == G_FILE_TYPE_DIRECTORY) {
    return LocalFailure(ErrorKind::Unsupported, "Deletion of directories is unsupported!");
  }

  GError* raw = nullptr;
  if (!g_file_delete(file.get(), nullptr, &raw)) {
    GErrorPtr err(raw);
    return FromGError(err.get(), "Delete failed.");
  }
  return Success();
}
