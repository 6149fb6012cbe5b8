#undef NDEBUG
#include <cassert>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "sftcurator/errors.hpp"
#include "sftcurator/templates.hpp"
#include "sftcurator/version_store.hpp"

using namespace sftcurator;

namespace {

std::filesystem::path MakeTempDir(const std::string& name) {
  auto dir = std::filesystem::temp_directory_path() / ("sftcurator_" + name);
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

std::vector<ChatRecord> MakeRecords(std::size_t n, const std::string& source) {
  std::vector<ChatRecord> out;
  for (std::size_t i = 0; i < n; ++i) {
    out.push_back(MakeChatRecord("q" + std::to_string(i), "answer " + source + " " + std::to_string(i), source));
  }
  return out;
}

std::vector<std::string> ReadLines(const std::filesystem::path& path) {
  std::vector<std::string> lines;
  std::ifstream in(path);
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty()) lines.push_back(line);
  }
  return lines;
}

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestNumberingAndRollback() {
  const auto base = MakeTempDir("store_numbering");
  VersionStore store(base);
  assert(store.ListVersions().empty());
  assert(!store.Current());

  const auto v1 = store.CreateSnapshot(MakeRecords(2, "a"), "first", {"a"});
  assert(v1 == "v001");
  const auto v2 = store.CreateSnapshot(MakeRecords(3, "b"), "second", {"b"});
  assert(v2 == "v002");
  assert(store.Current() && *store.Current() == "v002");
  assert(store.ListVersions()[1].parent_version && *store.ListVersions()[1].parent_version == "v001");
  assert(!store.ListVersions()[0].parent_version);
  assert(std::filesystem::exists(store.VersionDir("v001") / "records.jsonl"));
  assert(std::filesystem::exists(store.VersionDir("v001") / "version_info.json"));

  const auto rolled = store.Rollback("v001");
  assert(rolled.size() == 2);
  assert(*store.Current() == "v001");
  assert(store.ListVersions().size() == 2);
  assert(store.CurrentRecords().size() == 2);

  // Numbering continues past the rolled-back-to version.
  const auto v3 = store.CreateSnapshot(MakeRecords(1, "c"));
  assert(v3 == "v003");
  assert(*store.ListVersions()[2].parent_version == "v001");

  assert(Throws<NotFoundError>([&] { store.Rollback("v999"); }));
  assert(*store.Current() == "v003");

  // State survives reopening.
  VersionStore reopened(base);
  assert(reopened.ListVersions().size() == 3);
  assert(*reopened.Current() == "v003");
  assert(reopened.ListVersions()[0].description == "first");
  assert(reopened.ListVersions()[0].record_count == 2);
  assert(reopened.LoadVersionRecords("v002").size() == 3);
  std::filesystem::remove_all(base);
}

void TestDiff() {
  const auto base = MakeTempDir("store_diff");
  VersionStore store(base);
  auto first = MakeRecords(2, "a");
  auto second = MakeRecords(3, "b");
  second.push_back(first[0]);
  store.CreateSnapshot(first);
  store.CreateSnapshot(second);

  const auto d = store.Diff("v001", "v002");
  assert(d.records_a == 2);
  assert(d.records_b == 4);
  assert(d.delta == 2);
  assert(d.new_sources == std::vector<std::string>{"b"});
  assert(d.removed_sources.empty());

  const auto back = store.Diff("v002", "v001");
  assert(back.delta == -2);
  assert(back.removed_sources == std::vector<std::string>{"b"});
  std::filesystem::remove_all(base);
}

void TestDeleteGuard() {
  const auto base = MakeTempDir("store_delete");
  VersionStore store(base);
  store.CreateSnapshot(MakeRecords(1, "a"));
  store.CreateSnapshot(MakeRecords(1, "b"));

  assert(Throws<InvalidOperationError>([&] { store.DeleteVersion("v002"); }));
  assert(std::filesystem::exists(store.VersionDir("v002") / "records.jsonl"));

  store.DeleteVersion("v001");
  assert(store.ListVersions().size() == 1);
  assert(!std::filesystem::exists(store.VersionDir("v001")));
  assert(Throws<NotFoundError>([&] { store.DeleteVersion("v001"); }));

  // Ids are never reused after a delete.
  assert(store.CreateSnapshot(MakeRecords(1, "c")) == "v003");
  std::filesystem::remove_all(base);
}

void TestDeleteRejectsUnknownIds() {
  const auto base = MakeTempDir("store_delete_ids");
  VersionStore store(base);
  store.CreateSnapshot(MakeRecords(1, "a"));
  store.CreateSnapshot(MakeRecords(2, "b"));

  for (const std::string id : {"", "..", ".", "v999", "v", "v01/../v002", "latest"}) {
    assert(Throws<NotFoundError>([&] { store.DeleteVersion(id); }));
  }
  assert(std::filesystem::exists(base / "manifest.json"));
  assert(std::filesystem::exists(store.VersionDir("v001") / "records.jsonl"));
  assert(std::filesystem::exists(store.VersionDir("v002") / "records.jsonl"));
  assert(store.ListVersions().size() == 2);
  assert(*store.Current() == "v002");
  assert(store.CurrentRecords().size() == 2);

  // A directory the manifest does not list is not deletable through the store.
  std::filesystem::create_directories(store.VersionDir("v007"));
  assert(Throws<NotFoundError>([&] { store.DeleteVersion("v007"); }));
  assert(std::filesystem::exists(store.VersionDir("v007")));

  assert(Throws<NotFoundError>([&] { store.Rollback(""); }));
  assert(Throws<NotFoundError>([&] { store.Rollback(".."); }));

  // Listed in the manifest but missing on disk.
  std::filesystem::remove_all(store.VersionDir("v001"));
  assert(Throws<NotFoundError>([&] { store.Rollback("v001"); }));
  assert(*store.Current() == "v002");

  assert(IsVersionId("v001"));
  assert(IsVersionId("v12"));
  assert(!IsVersionId("v"));
  assert(!IsVersionId("001"));
  assert(!IsVersionId("v0a1"));
  std::filesystem::remove_all(base);
}

void TestMerge() {
  const auto base = MakeTempDir("store_merge");
  const auto training = base / "training";
  std::filesystem::create_directories(training);
  {
    std::ofstream out(training / "train.jsonl");
    for (const auto& r : MakeRecords(3, "existing")) out << ToJsonLine(r) << "\n";
  }

  VersionStore store(base / "pipeline", training);
  const auto v = store.CreateSnapshot(MakeRecords(2, "new"));
  const auto path = store.MergeToTraining();
  assert(path == training / "train.jsonl");

  const auto lines = ReadLines(path);
  assert(lines.size() == 5);
  assert(ParseChatRecordLine(lines[0]).source == "existing");
  assert(ParseChatRecordLine(lines[4]).source == "new");

  std::size_t backups = 0;
  for (const auto& entry : std::filesystem::directory_iterator(training)) {
    if (entry.path().filename().string().find("train.jsonl.bak.") == 0) {
      ++backups;
      assert(entry.path().filename().string() == "train.jsonl.bak." + v);
      assert(ReadLines(entry.path()).size() == 3);
    }
  }
  assert(backups == 1);

  VersionStore no_training(base / "other");
  no_training.CreateSnapshot(MakeRecords(1, "x"));
  assert(Throws<InvalidOperationError>([&] { no_training.MergeToTraining(); }));

  // A missing destination is created without a backup.
  const auto fresh = base / "fresh";
  VersionStore fresh_store(base / "fresh_pipeline", fresh);
  fresh_store.CreateSnapshot(MakeRecords(2, "y"));
  assert(ReadLines(fresh_store.MergeToTraining()).size() == 2);
  assert(!std::filesystem::exists(fresh / "train.jsonl.bak.v001"));
  std::filesystem::remove_all(base);
}

void TestManifestParsing() {
  assert(NextVersionId(Manifest{}) == "v001");
  Manifest m;
  m.versions.push_back(VersionInfo{"v009", "", "", 0, {}, std::nullopt});
  assert(NextVersionId(m) == "v010");

  const auto base = MakeTempDir("store_manifest");
  {
    std::ofstream out(base / "manifest.json");
    out << R"({"versions": [{"version": "v001"}], "current": "v002"})";
  }
  assert(Throws<MalformedInputError>([&] { VersionStore store(base); }));
  {
    std::ofstream out(base / "manifest.json", std::ios::trunc);
    out << "not json";
  }
  assert(Throws<MalformedInputError>([&] { VersionStore store(base); }));
  std::filesystem::remove_all(base);
}

}  // namespace

int main() {
  TestNumberingAndRollback();
  TestDiff();
  TestDeleteGuard();
  TestDeleteRejectsUnknownIds();
  TestMerge();
  TestManifestParsing();
  return 0;
}
