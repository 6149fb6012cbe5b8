#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/stl/filesystem.h>

#include "sftcurator/dedup_index.hpp"
#include "sftcurator/errors.hpp"
#include "sftcurator/quality_filter.hpp"
#include "sftcurator/record.hpp"
#include "sftcurator/version_store.hpp"

namespace py = pybind11;
using namespace sftcurator;

namespace {

std::vector<ChatRecord> ParseLines(const std::vector<std::string>& lines) {
  std::vector<ChatRecord> out;
  out.reserve(lines.size());
  for (const auto& line : lines) out.push_back(ParseChatRecordLine(line));
  return out;
}

std::vector<std::string> ToLines(const std::vector<ChatRecord>& records) {
  std::vector<std::string> out;
  out.reserve(records.size());
  for (const auto& r : records) out.push_back(ToJsonLine(r));
  return out;
}

}  // namespace

PYBIND11_MODULE(pysftcurator, m) {
  py::register_exception<NotFoundError>(m, "NotFoundError", PyExc_KeyError);
  py::register_exception<InvalidOperationError>(m, "InvalidOperationError", PyExc_RuntimeError);
  py::register_exception<MalformedInputError>(m, "MalformedInputError", PyExc_ValueError);

  py::class_<QualityOptions>(m, "QualityOptions")
      .def(py::init<>())
      .def_readwrite("min_content_length", &QualityOptions::min_content_length)
      .def_readwrite("min_answer_length", &QualityOptions::min_answer_length)
      .def_readwrite("max_answer_length", &QualityOptions::max_answer_length)
      .def_readwrite("max_table_ratio", &QualityOptions::max_table_ratio)
      .def_readwrite("min_alpha_ratio", &QualityOptions::min_alpha_ratio)
      .def_readwrite("max_image_artifacts", &QualityOptions::max_image_artifacts);

  py::class_<QualityFilter>(m, "QualityFilter")
      .def(py::init<QualityOptions>(), py::arg("options") = QualityOptions{})
      // Returns (passed, reason); reason is "" when passed.
      .def("evaluate",
           [](const QualityFilter& self, const std::string& text) {
             const auto v = self.Evaluate(text);
             return py::make_tuple(v.accepted, v.accepted ? std::string() : std::string(RejectReasonName(v.reason)));
           })
      .def("evaluate_raw", [](const QualityFilter& self, const std::string& text) {
        const auto v = self.EvaluateRaw(text);
        return py::make_tuple(v.accepted, v.accepted ? std::string() : std::string(RejectReasonName(v.reason)));
      });

  py::class_<DedupOptions>(m, "DedupOptions")
      .def(py::init<>())
      .def_readwrite("num_perm", &DedupOptions::num_perm)
      .def_readwrite("lsh_threshold", &DedupOptions::lsh_threshold)
      .def_readwrite("shingle_size", &DedupOptions::shingle_size);

  py::class_<DedupIndex>(m, "DedupIndex")
      .def(py::init([](DedupOptions opts) { return DedupIndex(opts); }), py::arg("options") = DedupOptions{})
      .def("seed_from_corpus", &DedupIndex::SeedFromCorpus)
      .def("check", [](const DedupIndex& self,
                       const std::string& text) { return std::string(DedupVerdictName(self.Check(text))); })
      .def("admit", &DedupIndex::Admit)
      .def("persist", &DedupIndex::Persist)
      .def("restore", &DedupIndex::Restore)
      .def_property_readonly("exact_size", &DedupIndex::ExactSize)
      .def_property_readonly("near_size", &DedupIndex::NearSize);

  py::class_<VersionDiff>(m, "VersionDiff")
      .def_readonly("version_a", &VersionDiff::version_a)
      .def_readonly("version_b", &VersionDiff::version_b)
      .def_readonly("records_a", &VersionDiff::records_a)
      .def_readonly("records_b", &VersionDiff::records_b)
      .def_readonly("delta", &VersionDiff::delta)
      .def_readonly("new_sources", &VersionDiff::new_sources)
      .def_readonly("removed_sources", &VersionDiff::removed_sources);

  // Records cross the boundary as JSON lines.
  py::class_<VersionStore>(m, "VersionStore")
      .def(py::init([](const std::string& base_dir, const std::string& training_data_dir) {
             std::optional<std::filesystem::path> training;
             if (!training_data_dir.empty()) training = training_data_dir;
             return std::make_unique<VersionStore>(base_dir, training);
           }),
           py::arg("base_dir"), py::arg("training_data_dir") = "")
      .def(
          "create_snapshot",
          [](VersionStore& self, const std::vector<std::string>& lines, const std::string& description,
             const std::vector<std::string>& sources) {
            return self.CreateSnapshot(ParseLines(lines), description, sources);
          },
          py::arg("records"), py::arg("description") = "", py::arg("sources") = std::vector<std::string>{})
      .def("rollback", [](VersionStore& self, const std::string& v) { return ToLines(self.Rollback(v)); })
      .def("list_versions",
           [](const VersionStore& self) {
             std::vector<std::string> out;
             for (const auto& v : self.ListVersions()) out.push_back(ToJson(v).dump());
             return out;
           })
      .def_property_readonly("current", &VersionStore::Current)
      .def("load_version_records",
           [](const VersionStore& self, const std::string& v) { return ToLines(self.LoadVersionRecords(v)); })
      .def("diff", &VersionStore::Diff)
      .def("delete_version", &VersionStore::DeleteVersion)
      .def("merge_to_training", &VersionStore::MergeToTraining, py::arg("version") = std::nullopt);
}
