#include "agentreplay/trace.hpp"

// Trace persistence: NDJSON files, optionally zstd-compressed.
//
// Writes go to a temp file beside the target and are renamed into place, so a
// reader never observes a half-written trace. Compression is chosen by the
// target extension on save and by the frame magic on load.

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <string_view>

#if defined(AGENTREPLAY_WITH_ZSTD)
#include <zstd.h>
#endif

#include "agentreplay/config.hpp"
#include "agentreplay/observability.hpp"

namespace fs = std::filesystem;

namespace agentreplay {

namespace {

constexpr unsigned char kZstdMagic[4] = {0x28, 0xB5, 0x2F, 0xFD};

bool has_zstd_magic(const std::string& data) {
  if (data.size() < sizeof(kZstdMagic)) return false;
  for (std::size_t i = 0; i < sizeof(kZstdMagic); ++i) {
    if (static_cast<unsigned char>(data[i]) != kZstdMagic[i]) return false;
  }
  return true;
}

bool ends_with(std::string_view s, std::string_view suffix) {
  return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

#if defined(AGENTREPLAY_WITH_ZSTD)
bool compress_zstd(const std::string& data, int level, std::string* out) {
  out->resize(ZSTD_compressBound(data.size()));
  const size_t n = ZSTD_compress(out->data(), out->size(), data.data(), data.size(), level);
  if (ZSTD_isError(n)) return false;
  out->resize(n);
  return true;
}

// Streaming decode, since frames written by other tools may omit the content
// size.
bool decompress_zstd(const std::string& data, std::string* out) {
  ZSTD_DStream* ds = ZSTD_createDStream();
  if (!ds) return false;
  if (ZSTD_isError(ZSTD_initDStream(ds))) {
    ZSTD_freeDStream(ds);
    return false;
  }
  std::string chunk(ZSTD_DStreamOutSize(), '\0');
  ZSTD_inBuffer in{data.data(), data.size(), 0};
  size_t ret = 0;
  out->clear();
  while (in.pos < in.size) {
    ZSTD_outBuffer o{chunk.data(), chunk.size(), 0};
    ret = ZSTD_decompressStream(ds, &o, &in);
    if (ZSTD_isError(ret)) {
      ZSTD_freeDStream(ds);
      return false;
    }
    out->append(chunk.data(), o.pos);
  }
  ZSTD_freeDStream(ds);
  return ret == 0;
}
#endif

std::string make_tmp_name(const fs::path& dir) {
  static thread_local std::mt19937 rng(std::random_device{}());
  std::uniform_int_distribution<uint64_t> dist;
  return (dir / (".tmp_" + std::to_string(dist(rng)))).string();
}

// Write to a temp file in the target directory, then rename into place.
bool atomic_write(const fs::path& target, const std::string& data, TraceError* error) {
  std::error_code ec;
  const fs::path dir = target.has_parent_path() ? target.parent_path() : fs::path(".");
  fs::create_directories(dir, ec);
  if (ec) return fail(error, ErrorCode::io_error, "cannot create " + dir.string() + ": " + ec.message());

  const std::string tmp = make_tmp_name(dir);
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs) return fail(error, ErrorCode::io_error, "cannot open " + tmp);
    ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!ofs) {
      std::remove(tmp.c_str());
      return fail(error, ErrorCode::io_error, "short write to " + tmp);
    }
  }
  fs::rename(tmp, target, ec);
  if (ec) {
    std::remove(tmp.c_str());
    return fail(error, ErrorCode::io_error, "cannot rename into " + target.string() + ": " + ec.message());
  }
  return true;
}

bool save_impl(const Trace& trace, const std::string& path, TraceError* error) {
  std::string payload = trace.to_ndjson();
  if (ends_with(path, ".zst")) {
#if defined(AGENTREPLAY_WITH_ZSTD)
    std::string compressed;
    if (!compress_zstd(payload, global_config().zstd_level, &compressed)) {
      return fail(error, ErrorCode::io_error, "zstd compression failed");
    }
    payload = std::move(compressed);
#else
    return fail(error, ErrorCode::io_error, "built without zstd support: " + path);
#endif
  }
  return atomic_write(path, payload, error);
}

std::optional<Trace> load_impl(const std::string& path, TraceError* error) {
  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) {
    fail(error, ErrorCode::not_found, "no such trace file: " + path);
    return std::nullopt;
  }
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) {
    fail(error, ErrorCode::not_found, "cannot open trace file: " + path);
    return std::nullopt;
  }
  std::string data((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());

  if (has_zstd_magic(data)) {
#if defined(AGENTREPLAY_WITH_ZSTD)
    std::string plain;
    if (!decompress_zstd(data, &plain)) {
      fail(error, ErrorCode::format_error, "corrupt zstd frame: " + path);
      return std::nullopt;
    }
    data = std::move(plain);
#else
    fail(error, ErrorCode::format_error, "compressed trace but built without zstd support: " + path);
    return std::nullopt;
#endif
  }
  return Trace::from_ndjson(data, error);
}

}  // namespace

bool Trace::save(const std::string& path, TraceError* error) const {
  ScopeTimer timer;
  TraceError local;
  const bool ok = save_impl(*this, path, &local);

  OperationEvent ev;
  ev.operation = "save";
  ev.trace_id = trace_id_;
  ev.path = path;
  ev.ok = ok;
  ev.error_code = to_string(local.code);
  ev.duration_ns = timer.elapsed_ns();
  ev.event_count = event_count();
  emit_operation_event(ev);

  if (!ok && error) *error = local;
  return ok;
}

std::optional<Trace> Trace::load(const std::string& path, TraceError* error) {
  ScopeTimer timer;
  TraceError local;
  auto trace = load_impl(path, &local);

  OperationEvent ev;
  ev.operation = "load";
  ev.path = path;
  ev.ok = trace.has_value();
  ev.error_code = to_string(local.code);
  ev.duration_ns = timer.elapsed_ns();
  if (trace) {
    ev.trace_id = trace->trace_id();
    ev.event_count = trace->event_count();
  }
  emit_operation_event(ev);

  if (!trace && error) *error = local;
  return trace;
}

}  // namespace agentreplay
