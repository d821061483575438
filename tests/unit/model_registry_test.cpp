#include <cassert>
#include <fstream>
#include <set>

#include "model_registry.hpp"
#include "test_support.hpp"

int main() {
    assert(model_id_from_path("models/ggml-tiny.en.bin") == "tiny.en");
    assert(model_id_from_path("ggml-large-v3.bin") == "large-v3");
    assert(model_id_from_path("ggml-.bin").empty());
    assert(model_id_from_path("tiny.bin").empty());
    assert(model_id_from_path("ggml-tiny-encoder-openvino.xml").empty());
    assert(accel_path_for("m/ggml-base.bin") == fs::path("m/ggml-base-encoder-openvino.xml"));

    assert(speed_rank("tiny.en") < speed_rank("base"));
    assert(speed_rank("base") < speed_rank("small.en"));
    assert(speed_rank("small") < speed_rank("medium"));
    assert(speed_rank("medium") < speed_rank("large-v3"));
    assert(speed_rank("distil") == 5);

    TempDir dir;
    make_model(dir.path, "tiny.en", 10, true);
    make_model(dir.path, "base", 20, false);
    std::ofstream(dir / "notes.txt") << "x";

    auto tiny = describe_model(dir / "ggml-tiny.en.bin");
    assert(tiny && tiny->has_accel && tiny->size == 10);
    assert(tiny->accel_path == dir / "ggml-tiny.en-encoder-openvino.xml");
    assert(!describe_model(dir / "ggml-missing.bin"));
    assert(!describe_model(dir / "notes.txt"));

    std::set<std::string> all;
    ModelScan scan(dir.path);
    for (const auto &model : scan) all.insert(model.id);
    assert((all == std::set<std::string>{"tiny.en", "base"}));

    std::set<std::string> warmable;
    for (const auto &model : ModelScan(dir.path, true)) warmable.insert(model.id);
    assert((warmable == std::set<std::string>{"tiny.en"}));

    // every begin() rescans, new files show up
    make_model(dir.path, "small", 30, true);
    size_t n = 0;
    for (auto it = scan.begin(); it != scan.end(); ++it) ++n;
    assert(n == 3);

    // a missing directory is an empty scan
    ModelScan none(dir / "absent");
    assert(none.begin() == none.end());
    return 0;
}
