/**
 * Sample encoder and frame mailbox tests.
 * Asserts:
 * - Conversion is clamp, asymmetric scale, round-to-nearest; NaN encodes as 0.
 * - Frames are emitted only at block boundaries; reset() drops a partial block.
 * - Little-endian serialization does not depend on host byte order.
 * - The mailbox drops (and counts) frames when full and carries one failure note.
 *
 * Run from build dir: ./test_sample_encoder
 */

#include "frame_mailbox.h"
#include "sample_encoder.h"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <vector>

using namespace live_scribe;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

static long reference_encode(double s) {
    double c = std::max(-1.0, std::min(1.0, s));
    return std::lround(c * (c < 0 ? 32768.0 : 32767.0));
}

int main() {
    // --- encode_sample ---
    ASSERT(SampleEncoder::encode_sample(0.0f) == 0);
    ASSERT(SampleEncoder::encode_sample(1.0f) == 32767);
    ASSERT(SampleEncoder::encode_sample(-1.0f) == -32768);
    ASSERT(SampleEncoder::encode_sample(0.5f) == 16384);     // 16383.5 rounds away from zero
    ASSERT(SampleEncoder::encode_sample(-0.5f) == -16384);
    ASSERT(SampleEncoder::encode_sample(2.5f) == 32767);     // clamped
    ASSERT(SampleEncoder::encode_sample(-7.0f) == -32768);   // clamped
    ASSERT(SampleEncoder::encode_sample(std::numeric_limits<float>::quiet_NaN()) == 0);
    ASSERT(SampleEncoder::encode_sample(std::numeric_limits<float>::infinity()) == 32767);
    ASSERT(SampleEncoder::encode_sample(-std::numeric_limits<float>::infinity()) == -32768);

    int mismatches = 0;
    for (int i = -1100; i <= 1100; i++) {
        float s = static_cast<float>(i) / 1000.0f;
        if (SampleEncoder::encode_sample(s) != reference_encode(s)) mismatches++;
    }
    ASSERT(mismatches == 0);

    // --- block boundaries ---
    {
        std::vector<AudioFrame> frames;
        SampleEncoder encoder(4);
        encoder.set_frame_callback([&frames](AudioFrame&& f) { frames.push_back(std::move(f)); });

        std::vector<float> samples = {0.0f, 0.25f, -0.25f};
        ASSERT(encoder.push(samples.data(), samples.size()) == 0);
        ASSERT(frames.empty());
        ASSERT(encoder.buffered() == 3);

        std::vector<float> more = {1.0f, -1.0f, 0.5f, 0.5f, 0.5f, 0.5f};
        ASSERT(encoder.push(more.data(), more.size()) == 2);
        ASSERT(frames.size() == 2);
        ASSERT(frames[0].size() == 4);
        ASSERT(frames[0][0] == 0);
        ASSERT(frames[0][3] == 32767);
        ASSERT(frames[1][0] == -32768);
        ASSERT(encoder.buffered() == 1);

        encoder.reset();
        ASSERT(encoder.buffered() == 0);
        std::vector<float> three(3, 0.1f);
        encoder.push(three.data(), three.size());
        ASSERT(frames.size() == 2);   // partial block was discarded, not completed
    }

    // --- default frame size ---
    {
        size_t emitted = 0;
        SampleEncoder encoder;
        encoder.set_frame_callback([&emitted](AudioFrame&& f) {
            if (f.size() == DEFAULT_FRAME_SAMPLES) emitted++;
        });
        std::vector<float> block(DEFAULT_FRAME_SAMPLES * 2 + 10, 0.0f);
        encoder.push(block.data(), block.size());
        ASSERT(emitted == 2);
        ASSERT(encoder.buffered() == 10);
    }

    // --- little-endian bytes ---
    {
        AudioFrame frame = {0x0102, -2, 32767, -32768};
        std::vector<uint8_t> bytes = SampleEncoder::to_le_bytes(frame);
        ASSERT(bytes.size() == 8);
        ASSERT(bytes[0] == 0x02 && bytes[1] == 0x01);
        ASSERT(bytes[2] == 0xFE && bytes[3] == 0xFF);
        ASSERT(bytes[4] == 0xFF && bytes[5] == 0x7F);
        ASSERT(bytes[6] == 0x00 && bytes[7] == 0x80);
    }

    // --- mailbox ---
    {
        FrameMailbox mailbox(2);
        ASSERT(mailbox.offer(AudioFrame(4, 1)));
        ASSERT(mailbox.offer(AudioFrame(4, 2)));
        ASSERT(!mailbox.offer(AudioFrame(4, 3)));
        ASSERT(mailbox.dropped() == 1);
        ASSERT(mailbox.size() == 2);

        std::vector<AudioFrame> drained = mailbox.drain();
        ASSERT(drained.size() == 2);
        ASSERT(drained[0][0] == 1 && drained[1][0] == 2);
        ASSERT(mailbox.size() == 0);
        ASSERT(mailbox.offer(AudioFrame(4, 4)));

        FrameMailbox zero(0);
        ASSERT(zero.capacity() == 1);

        // Failure note: first report wins, taken once, cleared by clear()
        FrameMailbox notes(2);
        ASSERT(notes.take_failure().empty());
        notes.report_failure("read failed");
        notes.report_failure("second");
        ASSERT(notes.take_failure() == "read failed");
        ASSERT(notes.take_failure().empty());
        notes.report_failure("");
        ASSERT(notes.take_failure() == "Audio capture failed");
        notes.report_failure("stale");
        notes.clear();
        ASSERT(notes.take_failure().empty());
    }

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All sample encoder tests passed.\n";
    return 0;
}
