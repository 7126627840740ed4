#pragma once

#include <torch/torch.h>

#include "shear.hpp"

#include <memory>
#include <optional>

/// Lattice and buffering parameters of a streaming session.
/// buffer_length must be a multiple of minimal_length(a, M, lt1, lt2); each
/// buffer is transformed on Lext = dgt_length(buffer_length + zero_padding).
struct StreamConfig {
    int64_t a;
    int64_t M;
    int64_t lt1 = 0;
    int64_t lt2 = 1;
    int64_t buffer_length;
    int64_t zero_padding;
};

enum class StreamStage { idle, priming, streaming, draining, done };

/// Producer of successive signal buffers for a stream.
class SignalSource {
public:
    virtual ~SignalSource() = default;

    /// Next buffer of at most max_length samples, shaped [n] or [n, W].
    /// Returns std::nullopt once the source is exhausted.
    virtual std::optional<torch::Tensor> next_buffer(int64_t max_length) = 0;
};

/// Serves consecutive slices of an in-memory signal [L] or [L, W].
class TensorSource : public SignalSource {
public:
    explicit TensorSource(torch::Tensor signal);

    std::optional<torch::Tensor> next_buffer(int64_t max_length) override;

private:
    torch::Tensor signal_;
    int64_t position_ = 0;
};

/// One emitted block: frames [k*Bn, (k+1)*Bn) of the stream, Bn = buffer_length/a.
struct StreamBlock {
    torch::Tensor coeffs;  // [M, Bn, W], complex128; Bn = 0 when nothing is left
    bool more;             // another call to next_block will emit a block
};

/// State of one streaming session. Owned by the caller and mutated only by
/// next_block and close_stream; never share one state between streams.
struct StreamState {
    StreamConfig config;
    std::unique_ptr<SignalSource> source;
    torch::Tensor window;              // FIR analysis window [gl]
    torch::Tensor long_window;         // window placed on [Lext]
    int64_t extended_length = 0;       // Lext
    int64_t block_frames = 0;          // Bn
    int64_t spill_frames = 0;          // local frames past Bn that reach the next block
    int64_t wrap_start = 0;            // first local frame that belongs to the previous block
    std::optional<ShearPlan> plan;     // built for Lext on the first next_block call
    StreamStage stage = StreamStage::idle;
    int64_t num_channels = 0;
    int64_t blocks_emitted = 0;
    bool source_exhausted = false;
    torch::Tensor pending;             // [M, Bn, W] block waiting for its successor
    torch::Tensor spill;               // [M, Bn, W] contributions to the next block
};

/// Start a stream over the source with an FIR window of length gl.
/// Requires gl <= zero_padding and ceil(gl/2) <= buffer_length.
StreamState open_stream(
    std::unique_ptr<SignalSource> source,
    torch::Tensor const& window,
    StreamConfig const& config);

/// Pull buffers until one block is complete and emit it. Emission lags the
/// source by one buffer; the last block is flushed once the source ends.
StreamBlock next_block(StreamState& state);

/// End the session and release the source and the overlap state.
void close_stream(StreamState& state);

/// Frames at each end of a streamed result that differ from the circular
/// one-shot transform of the same signal: ceil(ceil(gl/2)/a).
int64_t stream_guard_frames(int64_t window_length, int64_t a);

/// Place an FIR window of length gl on [L]: the first ceil(gl/2) taps at the
/// start, the remaining taps at the end.
torch::Tensor fir_to_long(torch::Tensor const& window, int64_t L);

/// Run a whole stream over an in-memory signal and concatenate the blocks.
/// Returns [M, N] or [M, N, W] with N = (number of buffers) * buffer_length / a.
torch::Tensor stream_dgt(
    torch::Tensor const& signal,
    torch::Tensor const& window,
    StreamConfig const& config);
