#include "gwskynet/model/onnx_classifier.hpp"
#include "gwskynet/core/errors.hpp"
#include "gwskynet/core/utils.hpp"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <string>

using namespace gwskynet;
namespace fs = std::filesystem;

namespace {

fs::path garbage_model(const std::string& name) {
    fs::path dir = fs::temp_directory_path() / "gwskynet_tests";
    fs::create_directories(dir);
    fs::path p = dir / name;
    core::write_text(p, "abc");
    return p;
}

// SHA-256 of "abc".
const std::string kAbcDigest = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";

std::string load_error(const config::ClassifierConfig& cfg) {
    try {
        model::OnnxClassifier classifier(cfg);
    } catch (const ModelUnavailableError& e) {
        return e.what();
    }
    return "";
}

} // namespace

TEST_CASE("onnx_classifier_requires_model_path") {
    config::ClassifierConfig cfg;
    REQUIRE_THROWS_AS(model::OnnxClassifier(cfg), ModelUnavailableError);
}

TEST_CASE("onnx_classifier_rejects_missing_file") {
    config::ClassifierConfig cfg;
    cfg.model_path = (fs::temp_directory_path() / "gwskynet_tests" / "no_such_model.onnx").string();
    fs::remove(cfg.model_path);
    REQUIRE(load_error(cfg).find("not found") != std::string::npos);
}

TEST_CASE("onnx_classifier_needs_eight_input_names") {
    config::ClassifierConfig cfg;
    cfg.model_path = garbage_model("seven_inputs.onnx").string();
    cfg.input_names.pop_back();
    REQUIRE(cfg.input_names.size() == 7);
    REQUIRE(load_error(cfg).find("8 input names") != std::string::npos);
}

TEST_CASE("onnx_classifier_checks_pinned_digest") {
    config::ClassifierConfig cfg;
    cfg.model_path = garbage_model("pinned.onnx").string();

    SECTION("wrong digest") {
        cfg.model_sha256 = std::string(64, '0');
        REQUIRE(load_error(cfg).find("does not match") != std::string::npos);
    }

    SECTION("matching digest in upper case reaches the parser") {
        cfg.model_sha256 = core::to_upper(kAbcDigest);
        const std::string msg = load_error(cfg);
        REQUIRE(msg.find("does not match") == std::string::npos);
        REQUIRE(msg.find("cannot load") != std::string::npos);
    }
}

TEST_CASE("onnx_classifier_rejects_unparsable_file") {
    config::ClassifierConfig cfg;
    cfg.model_path = garbage_model("garbage.onnx").string();
    REQUIRE_THROWS_AS(model::OnnxClassifier::load(cfg), ModelUnavailableError);
}
