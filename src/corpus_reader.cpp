#include "sftcurator/corpus_reader.hpp"

#include <cstdint>
#include <fstream>
#include <stdexcept>

#include <lzma.h>
#include <zlib.h>

#include "sftcurator/errors.hpp"

namespace sftcurator {

namespace {

bool EndsWith(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

void StripLineEnd(std::string& line) {
  while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
    line.pop_back();
  }
}

bool IsBlank(const std::string& line) {
  for (char c : line) {
    if (c != ' ' && c != '\t' && c != '\r' && c != '\n') {
      return false;
    }
  }
  return true;
}

}  // namespace

CorpusFormat DetectCorpusFormat(const std::string& path) {
  if (EndsWith(path, ".jsonl.gz") || EndsWith(path, ".ndjson.gz")) return CorpusFormat::kJsonlGz;
  if (EndsWith(path, ".jsonl.xz") || EndsWith(path, ".ndjson.xz")) return CorpusFormat::kJsonlXz;
  if (EndsWith(path, ".jsonl") || EndsWith(path, ".ndjson")) return CorpusFormat::kJsonl;
  return CorpusFormat::kUnknown;
}

CorpusReader::CorpusReader(Reporter& reporter) : reporter_(reporter) {}

bool CorpusReader::ForEachLine(const std::string& path,
                               const std::function<void(const std::string&)>& fn) const {
  switch (DetectCorpusFormat(path)) {
    case CorpusFormat::kJsonlGz:
      return ReadGzLines(path, fn);
    case CorpusFormat::kJsonlXz:
      return ReadXzLines(path, fn);
    case CorpusFormat::kJsonl:
    case CorpusFormat::kUnknown:
      break;
  }
  return ReadTextLines(path, fn);
}

bool CorpusReader::ReadTextLines(const std::string& path,
                                 const std::function<void(const std::string&)>& fn) const {
  std::ifstream in(path, std::ios::binary);
  if (!in) return false;
  std::string line;
  while (std::getline(in, line)) {
    StripLineEnd(line);
    fn(line);
  }
  return true;
}

bool CorpusReader::ReadGzLines(const std::string& path,
                               const std::function<void(const std::string&)>& fn) const {
  gzFile gz = gzopen(path.c_str(), "rb");
  if (!gz) return false;
  const int buf_size = 1 << 16;
  std::string buf(buf_size, '\0');
  std::string line;
  while (char* res = gzgets(gz, buf.data(), buf_size)) {
    line.assign(res);
    while (!line.empty() && line.back() != '\n' && !gzeof(gz)) {
      res = gzgets(gz, buf.data(), buf_size);
      if (!res) break;
      line.append(res);
    }
    StripLineEnd(line);
    fn(line);
  }
  int errnum = Z_OK;
  gzerror(gz, &errnum);
  gzclose(gz);
  return errnum == Z_OK || errnum == Z_STREAM_END;
}

bool CorpusReader::ReadXzLines(const std::string& path,
                               const std::function<void(const std::string&)>& fn) const {
  std::ifstream in(path, std::ios::binary);
  if (!in) return false;

  lzma_stream strm = LZMA_STREAM_INIT;
  if (lzma_stream_decoder(&strm, UINT64_MAX, 0) != LZMA_OK) {
    return false;
  }

  std::vector<std::uint8_t> in_buf(1 << 16);
  std::vector<std::uint8_t> out_buf(1 << 16);
  std::string pending;
  lzma_action action = LZMA_RUN;
  bool ok = true;

  while (true) {
    if (strm.avail_in == 0 && action == LZMA_RUN) {
      in.read(reinterpret_cast<char*>(in_buf.data()), static_cast<std::streamsize>(in_buf.size()));
      const auto got = in.gcount();
      strm.next_in = in_buf.data();
      strm.avail_in = static_cast<std::size_t>(got);
      if (got == 0) action = LZMA_FINISH;
    }

    strm.next_out = out_buf.data();
    strm.avail_out = out_buf.size();
    const lzma_ret ret = lzma_code(&strm, action);
    const std::size_t produced = out_buf.size() - strm.avail_out;
    pending.append(reinterpret_cast<const char*>(out_buf.data()), produced);

    std::size_t start = 0;
    for (std::size_t pos = pending.find('\n'); pos != std::string::npos; pos = pending.find('\n', start)) {
      std::string line = pending.substr(start, pos - start);
      StripLineEnd(line);
      fn(line);
      start = pos + 1;
    }
    pending.erase(0, start);

    if (ret == LZMA_STREAM_END) break;
    if (ret != LZMA_OK) {
      ok = false;
      break;
    }
  }
  lzma_end(&strm);

  if (ok && !pending.empty()) {
    StripLineEnd(pending);
    fn(pending);
  }
  return ok;
}

bool CorpusReader::LoadChatRecords(const std::string& path, std::vector<ChatRecord>& out,
                                   CorpusLoadStats* stats) const {
  CorpusLoadStats local;
  std::size_t line_no = 0;
  const bool ok = ForEachLine(path, [&](const std::string& line) {
    ++line_no;
    if (IsBlank(line)) return;
    ++local.lines;
    try {
      out.push_back(ParseChatRecordLine(line));
      ++local.loaded;
    } catch (const MalformedInputError& e) {
      ++local.skipped;
      reporter_.Warn("skipping malformed record",
                     {{"file", path}, {"line", std::to_string(line_no)}, {"error", e.what()}});
    }
  });
  if (stats) {
    stats->lines += local.lines;
    stats->loaded += local.loaded;
    stats->skipped += local.skipped;
  }
  return ok;
}

bool CorpusReader::LoadRawRecords(const std::string& path, std::vector<RawRecord>& out,
                                  CorpusLoadStats* stats) const {
  CorpusLoadStats local;
  std::size_t line_no = 0;
  const bool ok = ForEachLine(path, [&](const std::string& line) {
    ++line_no;
    if (IsBlank(line)) return;
    ++local.lines;
    auto j = nlohmann::json::parse(line, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
      ++local.skipped;
      reporter_.Warn("skipping malformed raw record", {{"file", path}, {"line", std::to_string(line_no)}});
      return;
    }
    out.push_back(RawRecord{std::move(j)});
    ++local.loaded;
  });
  if (stats) {
    stats->lines += local.lines;
    stats->loaded += local.loaded;
    stats->skipped += local.skipped;
  }
  return ok;
}

std::vector<ChatRecord> CorpusReader::LoadCorpusDir(const std::filesystem::path& dir,
                                                    CorpusLoadStats* stats) const {
  std::vector<ChatRecord> records;
  for (const auto& file : ResolveCorpusFiles(dir)) {
    if (!LoadChatRecords(file.string(), records, stats)) {
      reporter_.Warn("failed to read corpus file", {{"file", file.string()}});
    }
  }
  return records;
}

std::vector<std::filesystem::path> ResolveCorpusFiles(const std::filesystem::path& dir) {
  std::vector<std::filesystem::path> files;
  std::error_code ec;
  if (dir.empty() || !std::filesystem::is_directory(dir, ec)) {
    return files;
  }
  for (const char* split : {"train", "validation"}) {
    for (const char* ext : {".jsonl", ".jsonl.gz", ".jsonl.xz"}) {
      auto candidate = dir / (std::string(split) + ext);
      if (std::filesystem::is_regular_file(candidate, ec)) {
        files.push_back(std::move(candidate));
        break;
      }
    }
  }
  return files;
}

void WriteJsonl(const std::filesystem::path& path, const std::vector<ChatRecord>& records) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw std::runtime_error("failed to open for writing: " + path.string());
  }
  for (const auto& record : records) {
    out << ToJsonLine(record) << '\n';
  }
  out.flush();
  if (!out) {
    throw std::runtime_error("failed to write: " + path.string());
  }
}

}  // namespace sftcurator
