#include "errors.hpp"
#include "stream.hpp"
#include "test_util.hpp"
#include "transform.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <utility>
#include <vector>

static constexpr double TOL = 1e-9;

/// Source that replays a fixed list of buffers.
class ScriptedSource : public SignalSource {
public:
    explicit ScriptedSource(std::vector<torch::Tensor> buffers) : buffers_(std::move(buffers)) {}

    std::optional<torch::Tensor> next_buffer(int64_t /*max_length*/) override {
        if (next_ >= buffers_.size()) {
            return std::nullopt;
        }
        return buffers_[next_++];
    }

private:
    std::vector<torch::Tensor> buffers_;
    size_t next_ = 0;
};

/// Buffer of one minimal length, zero padding of half of it, window filling the padding.
static StreamConfig minimal_config(LatticeCase const& lc) {
    int64_t const smallest = minimal_length(lc.a, lc.M, lc.lt1, lc.lt2);
    return StreamConfig{
        .a = lc.a,
        .M = lc.M,
        .lt1 = lc.lt1,
        .lt2 = lc.lt2,
        .buffer_length = smallest,
        .zero_padding = smallest / 2,
    };
}

// --- Helpers ---

static void test_fir_to_long() {
    auto g = torch::arange(1, 6, torch::kFloat64);
    auto placed = fir_to_long(g, 10);
    auto expected = torch::tensor({1.0, 2.0, 3.0, 0.0, 0.0, 0.0, 0.0, 0.0, 4.0, 5.0}, torch::kFloat64);
    assert(max_error(placed, expected) == 0.0);
    assert(max_error(fir_to_long(g, 5), g) == 0.0);
    assert(throws<ShapeMismatchError>([&] { fir_to_long(g, 4); }));

    assert(stream_guard_frames(12, 4) == 2);
    assert(stream_guard_frames(15, 3) == 3);
    assert(stream_guard_frames(6, 4) == 1);
    std::cout << "  test_fir_to_long passed." << std::endl;
}

// --- Equivalence with the one-shot transform ---

static void test_matches_one_shot() {
    for (auto const& lc : lattice_cases()) {
        auto const config = minimal_config(lc);
        int64_t const L = 10 * config.buffer_length;
        int64_t const gl = config.zero_padding;
        int64_t const N = L / lc.a;
        int64_t const guard = stream_guard_frames(gl, lc.a);

        auto f = crand({L, 2});
        auto g = crand({gl});
        auto streamed = stream_dgt(f, g, config);
        assert(streamed.sizes() == torch::IntArrayRef({lc.M, N, 2}));

        auto one_shot = nonsep_dgt(f, fir_to_long(g, L), lc.a, lc.M, lc.lt1, lc.lt2);
        double const err = rel_error(
            streamed.narrow(1, guard, N - 2 * guard), one_shot.narrow(1, guard, N - 2 * guard));
        if (err >= TOL) {
            std::cerr << "  " << lattice_name(lc) << " error " << err << std::endl;
        }
        assert(err < TOL);
    }
    std::cout << "  test_matches_one_shot passed." << std::endl;
}

static void test_longer_buffers() {
    // Two minimal lengths per buffer and a real signal.
    LatticeCase const lc{3, 5, 1, 2};
    StreamConfig const config{.a = 3, .M = 5, .lt1 = 1, .lt2 = 2, .buffer_length = 60, .zero_padding = 21};
    int64_t const L = 300, N = 100, gl = 21;
    int64_t const guard = stream_guard_frames(gl, lc.a);

    auto f = rrand({L});
    auto g = rrand({gl});
    auto streamed = stream_dgt(f, g, config);
    assert(streamed.sizes() == torch::IntArrayRef({5, N}));

    auto one_shot = nonsep_dgt(f, fir_to_long(g, L), lc.a, lc.M, lc.lt1, lc.lt2);
    assert(rel_error(streamed.narrow(1, guard, N - 2 * guard),
                     one_shot.narrow(1, guard, N - 2 * guard)) < TOL);
    std::cout << "  test_longer_buffers passed." << std::endl;
}

static void test_channels_are_independent() {
    auto const config = minimal_config({4, 6, 1, 2});
    auto f = crand({120, 2});
    auto g = crand({12});
    auto both = stream_dgt(f, g, config);
    assert(max_error(both.select(2, 0), stream_dgt(f.select(1, 0), g, config)) < 1e-12);
    assert(max_error(both.select(2, 1), stream_dgt(f.select(1, 1), g, config)) < 1e-12);
    std::cout << "  test_channels_are_independent passed." << std::endl;
}

// --- State machine ---

static void test_block_sequence() {
    auto const config = minimal_config({4, 6, 1, 2});
    int64_t const Bn = config.buffer_length / config.a;
    auto state = open_stream(std::make_unique<TensorSource>(crand({72})), crand({12}), config);
    assert(state.stage == StreamStage::idle);
    assert(state.extended_length == 48);

    auto first = next_block(state);
    assert(first.more);
    assert(first.coeffs.sizes() == torch::IntArrayRef({6, Bn, 1}));
    assert(state.stage == StreamStage::streaming);
    assert(state.plan.has_value());

    auto second = next_block(state);
    assert(second.more);
    assert(state.stage == StreamStage::streaming);

    auto third = next_block(state);
    assert(!third.more);
    assert(third.coeffs.size(1) == Bn);
    assert(state.stage == StreamStage::done);
    assert(state.blocks_emitted == 3);

    auto after = next_block(state);
    assert(!after.more);
    assert(after.coeffs.size(1) == 0);
    close_stream(state);
    std::cout << "  test_block_sequence passed." << std::endl;
}

static void test_short_final_buffer() {
    auto const config = minimal_config({4, 6, 1, 2});
    auto f = crand({60});
    auto g = crand({12});

    auto state = open_stream(std::make_unique<TensorSource>(f), g, config);
    auto first = next_block(state);
    auto second = next_block(state);
    assert(first.more && second.more);
    assert(state.stage == StreamStage::draining);
    auto third = next_block(state);
    assert(!third.more);
    assert(state.stage == StreamStage::done);

    // Same as streaming the signal padded with zeros to three buffers.
    auto padded = torch::cat({f, torch::zeros({12}, torch::kComplex128)});
    auto expected = stream_dgt(padded, g, config);
    auto got = torch::cat({first.coeffs, second.coeffs, third.coeffs}, 1).squeeze(2);
    assert(max_error(got, expected) < 1e-12);
    std::cout << "  test_short_final_buffer passed." << std::endl;
}

static void test_empty_source() {
    auto const config = minimal_config({4, 6, 1, 2});
    auto state = open_stream(std::make_unique<TensorSource>(torch::zeros({0})), crand({12}), config);
    auto block = next_block(state);
    assert(!block.more);
    assert(block.coeffs.size(1) == 0);
    assert(state.stage == StreamStage::done);
    assert(state.blocks_emitted == 0);

    auto coeffs = stream_dgt(torch::zeros({0}), crand({12}), config);
    assert(coeffs.sizes() == torch::IntArrayRef({6, 0}));
    std::cout << "  test_empty_source passed." << std::endl;
}

static void test_close_undrained() {
    auto const config = minimal_config({4, 6, 1, 2});
    auto state = open_stream(std::make_unique<TensorSource>(crand({96})), crand({12}), config);
    auto block = next_block(state);
    assert(block.more);

    close_stream(state);  // warns about the pending block
    assert(state.stage == StreamStage::done);
    assert(!state.source);
    assert(!state.pending.defined());
    assert(!next_block(state).more);
    std::cout << "  test_close_undrained passed." << std::endl;
}

static void test_interleaved_streams() {
    auto const config = minimal_config({4, 6, 2, 3});
    auto f1 = crand({144});
    auto f2 = crand({144});
    auto g = crand({18});

    auto s1 = open_stream(std::make_unique<TensorSource>(f1), g, config);
    auto s2 = open_stream(std::make_unique<TensorSource>(f2), g, config);
    std::vector<torch::Tensor> out1, out2;
    bool more1 = true, more2 = true;
    while (more1 || more2) {
        if (more1) {
            auto b = next_block(s1);
            out1.push_back(b.coeffs);
            more1 = b.more;
        }
        if (more2) {
            auto b = next_block(s2);
            out2.push_back(b.coeffs);
            more2 = b.more;
        }
    }
    close_stream(s1);
    close_stream(s2);

    assert(max_error(torch::cat(out1, 1).squeeze(2), stream_dgt(f1, g, config)) < 1e-12);
    assert(max_error(torch::cat(out2, 1).squeeze(2), stream_dgt(f2, g, config)) < 1e-12);
    std::cout << "  test_interleaved_streams passed." << std::endl;
}

// --- Errors ---

static void test_invalid_configurations() {
    auto g = crand({12});
    auto make = [&](StreamConfig const& config, torch::Tensor const& window) {
        return open_stream(std::make_unique<TensorSource>(crand({96})), window, config);
    };
    StreamConfig const base = minimal_config({4, 6, 1, 2});

    auto bad_length = base;
    bad_length.buffer_length = 36;
    assert(throws<IncompatibleLatticeError>([&] { make(bad_length, g); }));

    auto zero_length = base;
    zero_length.buffer_length = 0;
    assert(throws<IncompatibleLatticeError>([&] { make(zero_length, g); }));

    auto negative_padding = base;
    negative_padding.zero_padding = -1;
    assert(throws<IncompatibleLatticeError>([&] { make(negative_padding, g); }));

    assert(throws<ShapeMismatchError>([&] { make(base, crand({16})); }));      // gl > zero padding
    assert(throws<ShapeMismatchError>([&] { make(base, crand({12, 1})); }));

    auto wide_padding = base;
    wide_padding.zero_padding = 60;
    assert(throws<ShapeMismatchError>([&] { make(wide_padding, crand({50})); }));  // ceil(gl/2) > 24

    auto bad_type = base;
    bad_type.lt1 = 2;
    assert(throws<IncompatibleLatticeError>([&] { make(bad_type, g); }));

    assert(throws<std::invalid_argument>([&] { open_stream(nullptr, g, base); }));
    std::cout << "  test_invalid_configurations passed." << std::endl;
}

static void test_bad_buffers() {
    StreamConfig const config = minimal_config({4, 6, 1, 2});
    auto g = crand({12});

    std::vector<torch::Tensor> oversize = {crand({30})};
    auto s1 = open_stream(std::make_unique<ScriptedSource>(oversize), g, config);
    assert(throws<ShapeMismatchError>([&] { next_block(s1); }));

    std::vector<torch::Tensor> channels = {crand({24, 2}), crand({24, 3})};
    auto s2 = open_stream(std::make_unique<ScriptedSource>(channels), g, config);
    assert(throws<ShapeMismatchError>([&] { next_block(s2); }));
    std::cout << "  test_bad_buffers passed." << std::endl;
}

int main() {
    torch::manual_seed(23);
    std::cout << "Running streaming tests..." << std::endl;

    test_fir_to_long();
    test_matches_one_shot();
    test_longer_buffers();
    test_channels_are_independent();
    test_block_sequence();
    test_short_final_buffer();
    test_empty_source();
    test_close_undrained();
    test_interleaved_streams();
    test_invalid_configurations();
    test_bad_buffers();

    std::cout << "All streaming tests passed." << std::endl;
    return 0;
}
