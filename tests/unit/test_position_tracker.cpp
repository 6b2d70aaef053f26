#include "../framework/SimpleTest.hpp"
#include "../fakes/FakeEngine.hpp"
#include "../fakes/FakeStores.hpp"
#include "collectors/PositionTracker.hpp"
#include <chrono>
#include <memory>
#include <stop_token>
#include <thread>
#include <vector>

using namespace reprise;
using namespace std::chrono_literals;
using collectors::PositionTracker;
using collectors::TrackerConfig;

namespace {

struct Fixture {
    test::FakeEngine engine;
    std::shared_ptr<backend::StatePublisher> publisher = std::make_shared<backend::StatePublisher>();
    std::shared_ptr<test::CountingMemoryStore> store = std::make_shared<test::CountingMemoryStore>();
    std::shared_ptr<test::FakeSnapshotStore> snapshots = std::make_shared<test::FakeSnapshotStore>();
    events::EventBus bus;
    backend::MemoryResolver resolver{store, snapshots, &bus};

    explicit Fixture(bool audiobook = false, bool playing = true) {
        publisher->update([&](model::Snapshot& s) {
            s.current_ref = model::MediaRef::from_path("/books/ch1.mp3");
            s.current_index = 0;
            s.display_name = "ch1";
            s.folder_identity = "/books";
            s.audiobook_mode = audiobook;
            s.is_playing = playing;
        });
        engine.set_duration(3600000);
    }
};

} // namespace

TEST_CASE(test_snapshot_every_tick_durable_every_tenth) {
    Fixture f;
    PositionTracker tracker(f.engine, f.publisher, f.resolver);

    for (int i = 0; i < 10; ++i) {
        f.engine.set_position(1000 * (i + 1));
        tracker.tick(std::stop_token{});
    }

    ASSERT_EQ(f.snapshots->puts.load(), 10);
    ASSERT_EQ(f.store->upserts.load(), 1);
    ASSERT_EQ(f.store->get_memory("/books/ch1.mp3")->position_ms, 10000);
    ASSERT_EQ(f.snapshots->last()->position_ms, 10000);

    auto snap = f.publisher->get_current();
    ASSERT_EQ(snap->position_ms, 10000);
    ASSERT_EQ(snap->duration_ms, 3600000);
}

TEST_CASE(test_custom_durable_cadence) {
    Fixture f;
    TrackerConfig config;
    config.durable_save_every_ticks = 3;
    PositionTracker tracker(f.engine, f.publisher, f.resolver, config);

    for (int i = 0; i < 7; ++i) tracker.tick(std::stop_token{});

    ASSERT_EQ(f.snapshots->puts.load(), 7);
    ASSERT_EQ(f.store->upserts.load(), 2);
}

TEST_CASE(test_tick_without_current_item_writes_nothing) {
    Fixture f;
    f.publisher->update([](model::Snapshot& s) { s.current_ref.reset(); });
    PositionTracker tracker(f.engine, f.publisher, f.resolver);

    for (int i = 0; i < 12; ++i) tracker.tick(std::stop_token{});

    ASSERT_EQ(f.snapshots->puts.load(), 0);
    ASSERT_EQ(f.store->upserts.load(), 0);
}

TEST_CASE(test_tick_skips_when_engine_moved_to_another_item) {
    Fixture f;
    PositionTracker tracker(f.engine, f.publisher, f.resolver);
    f.engine.set_position(4000);
    tracker.tick(std::stop_token{});
    ASSERT_EQ(f.snapshots->puts.load(), 1);

    // Engine is already on item 1, the transition has not been applied yet
    f.engine.seek_to(1, 250);
    tracker.tick(std::stop_token{});
    ASSERT_EQ(f.snapshots->puts.load(), 1);
    ASSERT_EQ(f.snapshots->last()->position_ms, 4000);
    ASSERT_EQ(f.publisher->get_current()->position_ms, 4000);

    f.publisher->update([](model::Snapshot& s) {
        s.current_index = 1;
        s.current_ref = model::MediaRef::from_path("/books/ch2.mp3");
    });
    tracker.tick(std::stop_token{});
    ASSERT_EQ(f.snapshots->puts.load(), 2);
    ASSERT_EQ(f.snapshots->last()->file_identity, "/books/ch2.mp3");
    ASSERT_EQ(f.snapshots->last()->position_ms, 250);
}

TEST_CASE(test_cancelled_tick_writes_nothing) {
    Fixture f;
    PositionTracker tracker(f.engine, f.publisher, f.resolver);

    std::stop_source source;
    source.request_stop();
    tracker.tick(source.get_token());

    ASSERT_EQ(f.snapshots->puts.load(), 0);
}

TEST_CASE(test_audiobook_autosave_fires_once_per_interval) {
    Fixture f(true);
    std::vector<model::MemorySaveEvent> saves;
    f.bus.subscribe(events::Event::Type::MemorySaved, [&saves](const events::Event& e) {
        if (e.memory) saves.push_back(*e.memory);
    });

    TrackerConfig config;
    config.tick_interval = 300ms;
    config.durable_save_every_ticks = 1000;
    config.audiobook_save_interval_ms = 1500;
    PositionTracker tracker(f.engine, f.publisher, f.resolver, config);

    for (int i = 0; i < 4; ++i) tracker.tick(std::stop_token{});
    ASSERT_EQ(tracker.audiobook_accumulator_ms(), 1200);
    ASSERT_TRUE(saves.empty());

    f.engine.set_position(77000);
    tracker.tick(std::stop_token{});
    ASSERT_EQ(saves.size(), 1u);
    ASSERT_TRUE(saves[0].is_auto_save);
    ASSERT_EQ(saves[0].position_ms, 77000);
    ASSERT_EQ(saves[0].display_name, "ch1");
    ASSERT_EQ(tracker.audiobook_accumulator_ms(), 0);
    ASSERT_EQ(f.store->upserts.load(), 1);

    for (int i = 0; i < 5; ++i) tracker.tick(std::stop_token{});
    ASSERT_EQ(saves.size(), 2u);
}

TEST_CASE(test_audiobook_accumulates_only_while_playing) {
    Fixture f(true, false);
    PositionTracker tracker(f.engine, f.publisher, f.resolver);

    tracker.tick(std::stop_token{});
    ASSERT_EQ(tracker.audiobook_accumulator_ms(), 0);

    f.publisher->update([](model::Snapshot& s) { s.is_playing = true; });
    tracker.tick(std::stop_token{});
    ASSERT_EQ(tracker.audiobook_accumulator_ms(), 300);

    tracker.reset_audiobook_accumulator();
    ASSERT_EQ(tracker.audiobook_accumulator_ms(), 0);
}

TEST_CASE(test_audiobook_off_never_accumulates) {
    Fixture f(false);
    PositionTracker tracker(f.engine, f.publisher, f.resolver);
    for (int i = 0; i < 3; ++i) tracker.tick(std::stop_token{});
    ASSERT_EQ(tracker.audiobook_accumulator_ms(), 0);
}

TEST_CASE(test_background_loop_start_stop) {
    Fixture f;
    TrackerConfig config;
    config.tick_interval = 10ms;
    PositionTracker tracker(f.engine, f.publisher, f.resolver, config);

    tracker.start();
    ASSERT_TRUE(tracker.is_running());
    std::this_thread::sleep_for(150ms);
    tracker.stop();
    ASSERT_FALSE(tracker.is_running());

    int after_stop = f.snapshots->puts.load();
    ASSERT_TRUE(after_stop > 0);
    std::this_thread::sleep_for(50ms);
    ASSERT_EQ(f.snapshots->puts.load(), after_stop);

    // A second start replaces the running loop
    tracker.start();
    tracker.start();
    std::this_thread::sleep_for(60ms);
    tracker.stop();
    ASSERT_TRUE(f.snapshots->puts.load() > after_stop);
}

int main() {
    return reprise::test::TestRunner::instance().run_all();
}
