/**
 * CommTree Python Bindings
 *
 * Exposes entity construction, tree induction, persistence and scoring.
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <memory>
#include <sstream>

#include "commtree/commtree.hpp"

namespace py = pybind11;
using namespace commtree;

// ============================================================================
// Python Classifier Class
// ============================================================================

/**
 * Owns its feature registry so trees never outlive the features they use.
 */
class CommentTreeClassifier {
public:
    CommentTreeClassifier(
        const std::string& features = "categories",
        float min_entropy = 0.10f,
        int min_count = 10,
        int verbosity = 0
    ) {
        if (features == "categories") {
            config_.features = FeatureSet::Categories;
        } else if (features == "targets") {
            config_.features = FeatureSet::Targets;
        } else {
            throw std::invalid_argument("features must be 'categories' or 'targets'");
        }
        if (min_count < 0) {
            throw std::invalid_argument("min_count cannot be negative");
        }
        config_.builder.min_entropy = min_entropy;
        config_.builder.min_count = static_cast<Index>(min_count);
        config_.verbosity = verbosity;
        config_.validate();
        registry_ = std::make_unique<FeatureRegistry>(FeatureRegistry::for_set(config_.features));
    }

    void fit(const std::vector<Entity>& entities) {
        TreeBuilder builder(*registry_, config_);
        tree_ = builder.fit(entities);
    }

    std::vector<std::string> predict(const std::vector<Entity>& entities) const {
        ensure_fitted();
        std::vector<std::string> result;
        result.reserve(entities.size());
        for (const auto& e : entities) {
            result.push_back(tree_.classify(e));
        }
        return result;
    }

    py::dict score(const std::vector<Entity>& entities) const {
        ensure_fitted();
        auto report = Evaluator::score_all(tree_, make_entity_list(entities));

        py::dict labels;
        for (const auto& s : report.labels) {
            py::dict d;
            d["precision"] = s.precision();
            d["recall"] = s.recall();
            d["f1"] = s.f1_score();
            d["correct"] = s.correct;
            d["predicted"] = s.predicted;
            d["actual"] = s.actual;
            labels[py::str(s.label)] = d;
        }

        py::dict result;
        result["labels"] = labels;
        result["accuracy"] = report.accuracy();
        result["correct"] = report.correct;
        result["total"] = report.total;
        return result;
    }

    std::string report(const std::vector<Entity>& entities) const {
        ensure_fitted();
        return Evaluator::format_report(Evaluator::score_all(tree_, make_entity_list(entities)));
    }

    std::string export_json(int indent) const {
        ensure_fitted();
        return TreeCodec::to_string(tree_, indent);
    }

    void import_json(const std::string& text) {
        tree_ = TreeCodec::parse(*registry_, text);
    }

    std::string dump() const {
        ensure_fitted();
        std::ostringstream out;
        tree_.dump(out);
        return out.str();
    }

    bool is_fitted() const { return !tree_.empty(); }
    size_t n_nodes() const { return tree_.n_nodes(); }
    size_t n_leaves() const { return tree_.n_leaves(); }
    uint16_t depth() const { return tree_.depth(); }

private:
    Config config_;
    std::unique_ptr<FeatureRegistry> registry_;
    Tree tree_;

    void ensure_fitted() const {
        if (tree_.empty()) {
            throw std::runtime_error("Model not fitted. Call fit() or import_json() first.");
        }
    }
};

// ============================================================================
// Module Definition
// ============================================================================

PYBIND11_MODULE(_commtree, m) {
    m.doc() = "CommTree: entropy-driven decision trees for comment classification";

    // Exceptions
    py::register_exception<InvalidSplit>(m, "InvalidSplit");
    py::register_exception<UnknownFeature>(m, "UnknownFeature");
    py::register_exception<TreeParseError>(m, "TreeParseError");

    py::class_<Entity>(m, "Entity")
        .def(py::init<>())
        .def(py::init<std::string>(), py::arg("label"))
        .def(py::init([](const std::string& label, const std::map<std::string, std::string>& attrs) {
            Entity e(label);
            for (const auto& kv : attrs) {
                e.set(kv.first, kv.second);
            }
            return e;
        }), py::arg("label"), py::arg("attributes"))
        .def("get", [](const Entity& e, const std::string& attr) -> py::object {
            const std::string* v = e.get(attr);
            if (!v) return py::none();
            return py::str(*v);
        }, py::arg("attr"))
        .def("set", &Entity::set, py::arg("attr"), py::arg("value"))
        .def("derive_deltas", [](Entity& e) { derive_comment_deltas(e); })
        .def_property("label", &Entity::label, &Entity::set_label)
        .def_property_readonly("attributes", &Entity::attributes);

    py::class_<CommentTreeClassifier>(m, "CommentTreeClassifier")
        .def(py::init<const std::string&, float, int, int>(),
             py::arg("features") = "categories",
             py::arg("min_entropy") = 0.10f,
             py::arg("min_count") = 10,
             py::arg("verbosity") = 0)
        .def("fit", &CommentTreeClassifier::fit, py::arg("entities"))
        .def("predict", &CommentTreeClassifier::predict, py::arg("entities"))
        .def("score", &CommentTreeClassifier::score, py::arg("entities"))
        .def("report", &CommentTreeClassifier::report, py::arg("entities"))
        .def("export_json", &CommentTreeClassifier::export_json, py::arg("indent") = -1)
        .def("import_json", &CommentTreeClassifier::import_json, py::arg("text"))
        .def("dump", &CommentTreeClassifier::dump)
        .def_property_readonly("is_fitted", &CommentTreeClassifier::is_fitted)
        .def_property_readonly("n_nodes", &CommentTreeClassifier::n_nodes)
        .def_property_readonly("n_leaves", &CommentTreeClassifier::n_leaves)
        .def_property_readonly("depth", &CommentTreeClassifier::depth);

    m.def("load_entities", [](const std::string& path, const std::string& label_attribute) {
        return EntityLoader(label_attribute).load(path);
    }, py::arg("path"), py::arg("label_attribute") = "key");

    m.def("entropy", &entropy, py::arg("counts"));

    m.attr("__version__") = COMMTREE_VERSION_STRING;
}
