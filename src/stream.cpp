#include "stream.hpp"

#include "errors.hpp"
#include "lattice.hpp"
#include "tensor_util.hpp"

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

// ========================== Sources ==========================

TensorSource::TensorSource(torch::Tensor signal) : signal_(std::move(signal)) {}

std::optional<torch::Tensor> TensorSource::next_buffer(int64_t max_length) {
    int64_t const remaining = signal_.size(0) - position_;
    if (remaining <= 0) {
        return std::nullopt;
    }
    int64_t const count = std::min(max_length, remaining);
    auto buffer = signal_.narrow(0, position_, count);
    position_ += count;
    return buffer;
}

// ========================== Helper functions ==========================

static int64_t ceil_div(int64_t x, int64_t y) {
    return (x + y - 1) / y;
}

static torch::Tensor empty_block(StreamState const& state) {
    int64_t const channels = std::max<int64_t>(state.num_channels, 1);
    return torch::zeros({state.config.M, 0, channels}, torch::kComplex128);
}

/// Fetch the next buffer zero-padded to [Lext, W], or nullopt at the end.
/// A short buffer is accepted once and marks the source as exhausted.
static std::optional<torch::Tensor> pull_buffer(StreamState& state) {
    int64_t const length = state.config.buffer_length;
    auto buffer = state.source->next_buffer(length);
    if (!buffer) {
        state.source_exhausted = true;
        return std::nullopt;
    }

    auto x = as_columns(*buffer, "stream buffer");
    int64_t const rows = x.size(0);
    if (rows > length) {
        throw ShapeMismatchError(
            "Stream source returned " + std::to_string(rows) +
            " samples, buffer length is " + std::to_string(length));
    }
    if (state.num_channels == 0) {
        state.num_channels = x.size(1);
    } else if (x.size(1) != state.num_channels) {
        throw ShapeMismatchError(
            "Stream buffer has " + std::to_string(x.size(1)) + " channels, expected " +
            std::to_string(state.num_channels));
    }
    if (rows == 0) {
        state.source_exhausted = true;
        return std::nullopt;
    }
    if (rows < length) {
        TORCH_WARN("Stream source returned ", rows, " of ", length,
                   " samples; zero-padding the final buffer and draining");
        state.source_exhausted = true;
    }

    auto working = to_working(x);
    auto padded = torch::zeros({state.extended_length, x.size(1)}, working.options());
    padded.narrow(0, 0, rows).copy_(working);
    return padded;
}

/// Transform one padded buffer and fold it into the overlap state.
/// Returns the block completed by this buffer's backward wrap, if any.
static torch::Tensor absorb(StreamState& state, torch::Tensor const& padded) {
    auto local = nonsep_dgt_shear(padded, state.long_window, *state.plan);  // [M, Next, W]

    int64_t const block = state.block_frames;
    int64_t const wrap = local.size(1) - state.wrap_start;

    // Frames at the end of the local transform are the previous block's tail.
    // The first buffer has no predecessor and its wrap is dropped.
    torch::Tensor completed;
    if (state.pending.defined()) {
        if (wrap > 0) {
            state.pending.narrow(1, block - wrap, wrap)
                .add_(local.narrow(1, state.wrap_start, wrap));
        }
        completed = state.pending;
    }

    auto own = local.narrow(1, 0, block).clone();
    if (state.spill.defined()) {
        own.add_(state.spill);
    }
    state.pending = own;
    state.spill = torch::zeros_like(own);
    if (state.spill_frames > 0) {
        state.spill.narrow(1, 0, state.spill_frames)
            .copy_(local.narrow(1, block, state.spill_frames));
    }
    return completed;
}

/// Emit the pending block as the final one.
static StreamBlock finish(StreamState& state) {
    auto block = state.pending.defined() ? state.pending : empty_block(state);
    state.pending = torch::Tensor();
    state.spill = torch::Tensor();
    state.stage = StreamStage::done;
    if (block.size(1) > 0) {
        ++state.blocks_emitted;
    }
    return StreamBlock{.coeffs = block, .more = false};
}

// ========================== Session ==========================

int64_t stream_guard_frames(int64_t window_length, int64_t a) {
    return ceil_div(ceil_div(window_length, 2), a);
}

torch::Tensor fir_to_long(torch::Tensor const& window, int64_t L) {
    if (window.dim() != 1) {
        throw ShapeMismatchError("FIR window must be one-dimensional");
    }
    int64_t const gl = window.size(0);
    if (gl > L) {
        throw ShapeMismatchError(
            "FIR window of length " + std::to_string(gl) +
            " does not fit in length " + std::to_string(L));
    }
    int64_t const head = ceil_div(gl, 2);
    auto working = to_working(window);
    auto placed = torch::zeros({L}, working.options());
    placed.narrow(0, 0, head).copy_(working.narrow(0, 0, head));
    placed.narrow(0, L - (gl - head), gl - head).copy_(working.narrow(0, head, gl - head));
    return placed;
}

StreamState open_stream(
    std::unique_ptr<SignalSource> source,
    torch::Tensor const& window,
    StreamConfig const& config) {

    if (!source) {
        throw std::invalid_argument("open_stream requires a signal source");
    }
    int64_t const smallest = minimal_length(config.a, config.M, config.lt1, config.lt2);
    if (config.buffer_length <= 0 || config.buffer_length % smallest != 0) {
        throw IncompatibleLatticeError(
            "Buffer length " + std::to_string(config.buffer_length) +
            " must be a positive multiple of the minimal length " + std::to_string(smallest));
    }
    if (config.zero_padding < 0) {
        throw IncompatibleLatticeError(
            "Zero padding must be non-negative, got " + std::to_string(config.zero_padding));
    }
    if (window.dim() != 1 || window.size(0) == 0) {
        throw ShapeMismatchError("Stream window must be a non-empty FIR window [gl]");
    }
    int64_t const gl = window.size(0);
    if (gl > config.zero_padding) {
        throw ShapeMismatchError(
            "Window length " + std::to_string(gl) + " exceeds zero padding " +
            std::to_string(config.zero_padding));
    }
    if (ceil_div(gl, 2) > config.buffer_length) {
        throw ShapeMismatchError(
            "Half window length " + std::to_string(ceil_div(gl, 2)) +
            " exceeds buffer length " + std::to_string(config.buffer_length));
    }

    StreamState state;
    state.config = config;
    state.source = std::move(source);
    state.window = to_working(window);
    state.extended_length = dgt_length(
        config.buffer_length + config.zero_padding, config.a, config.M, config.lt1, config.lt2);
    state.long_window = fir_to_long(state.window, state.extended_length);
    state.block_frames = config.buffer_length / config.a;

    // Local frame t contributes to this block while t < buffer_length + gl/2
    // and to the previous block once t > Lext - ceil(gl/2).
    state.spill_frames = ceil_div(config.buffer_length + gl / 2, config.a) - state.block_frames;
    state.wrap_start = (state.extended_length - ceil_div(gl, 2)) / config.a + 1;
    return state;
}

StreamBlock next_block(StreamState& state) {
    switch (state.stage) {
    case StreamStage::done:
        return StreamBlock{.coeffs = empty_block(state), .more = false};
    case StreamStage::draining:
        return finish(state);
    case StreamStage::idle: {
        auto const& cfg = state.config;
        state.plan = make_shear_plan(state.extended_length, cfg.a, cfg.M, cfg.lt1, cfg.lt2);
        state.stage = StreamStage::priming;
        auto first = pull_buffer(state);
        if (!first) {
            state.stage = StreamStage::done;
            return StreamBlock{.coeffs = empty_block(state), .more = false};
        }
        absorb(state, *first);
        break;
    }
    case StreamStage::priming:
    case StreamStage::streaming:
        break;
    }

    if (state.source_exhausted) {
        return finish(state);
    }
    auto buffer = pull_buffer(state);
    if (!buffer) {
        return finish(state);
    }
    auto completed = absorb(state, *buffer);
    state.stage = state.source_exhausted ? StreamStage::draining : StreamStage::streaming;
    ++state.blocks_emitted;
    return StreamBlock{.coeffs = completed, .more = true};
}

void close_stream(StreamState& state) {
    if (state.pending.defined() && state.stage != StreamStage::done) {
        TORCH_WARN("Closing stream with an undrained block after ",
                   state.blocks_emitted, " emitted blocks");
    }
    state.source.reset();
    state.plan.reset();
    state.pending = torch::Tensor();
    state.spill = torch::Tensor();
    state.stage = StreamStage::done;
}

torch::Tensor stream_dgt(
    torch::Tensor const& signal,
    torch::Tensor const& window,
    StreamConfig const& config) {

    auto state = open_stream(std::make_unique<TensorSource>(signal), window, config);

    std::vector<torch::Tensor> blocks;
    while (true) {
        auto block = next_block(state);
        if (block.coeffs.size(1) > 0) {
            blocks.push_back(block.coeffs);
        }
        if (!block.more) {
            break;
        }
    }
    close_stream(state);

    int64_t const channels = signal.dim() == 2 ? signal.size(1) : 1;
    auto coeffs = blocks.empty()
        ? torch::zeros({config.M, 0, channels}, torch::kComplex128)
        : torch::cat(blocks, /*dim=*/1);
    return signal.dim() == 2 ? coeffs : coeffs.squeeze(2);
}
