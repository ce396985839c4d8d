/**
 * Spoken-reply gate.
 * Asserts:
 * - on_start fires once when audio begins; on_end fires exactly once per utterance.
 * - Errors (before or after start) still end the utterance.
 * - mute/cancel/new speak cut off the current utterance and end it.
 * - Callbacks from a superseded utterance are ignored.
 *
 * Run from build dir: ./test_speech_gate
 */

#include "speech_output_gate.h"
#include "test_fakes.h"
#include <memory>

using namespace wayfarer;
using namespace wayfarer::testing;

struct Recorder {
    std::vector<uint64_t> starts;
    std::vector<uint64_t> ends;

    SpeechOutputGate::Callbacks callbacks() {
        SpeechOutputGate::Callbacks cb;
        cb.on_start = [this](uint64_t id) { starts.push_back(id); };
        cb.on_end = [this](uint64_t id) { ends.push_back(id); };
        return cb;
    }
};

int main() {
    // --- normal lifecycle ---
    {
        auto engine = std::make_shared<FakeSpeechEngine>();
        Recorder rec;
        SpeechOutputGate gate(engine, rec.callbacks());

        uint64_t id = gate.speak("Here are flights to Mumbai.");
        ASSERT(id != 0);
        ASSERT(engine->spoken.size() == 1);
        ASSERT(rec.starts.empty());
        ASSERT(!gate.is_speaking());

        engine->start();
        engine->start();
        ASSERT(rec.starts.size() == 1 && rec.starts[0] == id);
        ASSERT(gate.is_speaking());

        engine->finish();
        ASSERT(rec.ends.size() == 1 && rec.ends[0] == id);
        ASSERT(!gate.is_speaking());

        // Nothing left to cancel
        gate.cancel();
        ASSERT(rec.ends.size() == 1);
        ASSERT(engine->cancel_calls == 0);
    }

    // --- error before audio still ends the utterance ---
    {
        auto engine = std::make_shared<FakeSpeechEngine>();
        Recorder rec;
        SpeechOutputGate gate(engine, rec.callbacks());
        uint64_t id = gate.speak("Hello");
        engine->fail("synthesis failed");
        ASSERT(rec.starts.empty());
        ASSERT(rec.ends.size() == 1 && rec.ends[0] == id);
    }

    // --- error after start ends once ---
    {
        auto engine = std::make_shared<FakeSpeechEngine>();
        Recorder rec;
        SpeechOutputGate gate(engine, rec.callbacks());
        gate.speak("Hello");
        engine->start();
        engine->fail("device lost");
        ASSERT(rec.starts.size() == 1);
        ASSERT(rec.ends.size() == 1);
    }

    // --- engine refuses to start ---
    {
        auto engine = std::make_shared<FakeSpeechEngine>();
        engine->refuse_next = true;
        Recorder rec;
        SpeechOutputGate gate(engine, rec.callbacks());
        uint64_t id = gate.speak("Hello");
        ASSERT(id != 0);
        ASSERT(rec.ends.size() == 1 && rec.ends[0] == id);
    }

    // --- no engine: speak ends immediately ---
    {
        Recorder rec;
        SpeechOutputGate gate(nullptr, rec.callbacks());
        uint64_t id = gate.speak("Hello");
        ASSERT(id != 0);
        ASSERT(rec.starts.empty());
        ASSERT(rec.ends.size() == 1);
    }

    // --- muted or blank text is a no-op ---
    {
        auto engine = std::make_shared<FakeSpeechEngine>();
        Recorder rec;
        SpeechOutputGate gate(engine, rec.callbacks(), true);
        ASSERT(gate.is_muted());
        ASSERT(gate.speak("Hello") == 0);
        gate.unmute();
        ASSERT(gate.speak("   \n") == 0);
        ASSERT(engine->spoken.empty());
        ASSERT(rec.starts.empty() && rec.ends.empty());
    }

    // --- mute cuts off the current utterance ---
    {
        auto engine = std::make_shared<FakeSpeechEngine>();
        Recorder rec;
        SpeechOutputGate gate(engine, rec.callbacks());
        uint64_t id = gate.speak("A long reply");
        engine->start();
        gate.mute();
        ASSERT(engine->cancel_calls == 1);
        ASSERT(rec.ends.size() == 1 && rec.ends[0] == id);
        ASSERT(!gate.is_speaking());
        ASSERT(gate.speak("Another") == 0);

        ASSERT(gate.toggle_mute() == false);
        ASSERT(!gate.is_muted());
        ASSERT(gate.toggle_mute() == true);
    }

    // --- a new speak replaces the current one; late callbacks are ignored ---
    {
        auto engine = std::make_shared<FakeSpeechEngine>();
        Recorder rec;
        SpeechOutputGate gate(engine, rec.callbacks());
        uint64_t first = gate.speak("First reply");
        engine->start();
        tts::SpeechCallbacks stale = engine->captured();

        uint64_t second = gate.speak("Second reply");
        ASSERT(second != first);
        ASSERT(engine->cancel_calls == 1);
        ASSERT(rec.ends.size() == 1 && rec.ends[0] == first);

        stale.on_start();
        stale.on_end();
        ASSERT(rec.starts.size() == 1);
        ASSERT(rec.ends.size() == 1);

        engine->start();
        engine->finish();
        ASSERT(rec.starts.size() == 2 && rec.starts[1] == second);
        ASSERT(rec.ends.size() == 2 && rec.ends[1] == second);
    }

    // --- cancel before start: engine stopped, no unbalanced end ---
    {
        auto engine = std::make_shared<FakeSpeechEngine>();
        Recorder rec;
        SpeechOutputGate gate(engine, rec.callbacks());
        gate.speak("Hello");
        gate.cancel();
        ASSERT(engine->cancel_calls == 1);
        ASSERT(rec.starts.empty());
        ASSERT(rec.ends.empty());
    }

    if (failed > 0) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All speech gate tests passed.\n";
    return 0;
}
