#include <doctest/doctest.h>

#include "RowTestHelper.hpp"

#include <taskrow/ui/SwipeableRow.hpp>

#include <chrono>
#include <memory>
#include <vector>

using namespace TR::UI;
using TR::UI::Testing::RowFixture;

TEST_SUITE("SwipeableRow") {
    TEST_CASE("editable_requires_not_completed") {
        for (bool completed : {false, true}) {
            CAPTURE(completed);
            RowFixture fixture;
            fixture.row.set_completed(completed);
            fixture.row.set_editable(true);
            CHECK(fixture.row.editable() == !completed);
        }
    }

    TEST_CASE("completed_setter_maps_state_to_visuals") {
        RowFixture fixture;
        auto& row = fixture.row;

        row.set_completed(true);
        CHECK(row.completed());
        CHECK(row.text_field().fully_struck());
        CHECK_FALSE(row.overlay().hidden);
        CHECK(row.overlay().background == row.config().colors.complete_dim);
        CHECK(row.text_field().alpha() == doctest::Approx(0.3f));
        CHECK_FALSE(row.editable());

        // Idempotent.
        row.set_completed(true);
        CHECK(row.text_field().fully_struck());
        CHECK(row.text_field().alpha() == doctest::Approx(0.3f));

        row.set_completed(false);
        CHECK_FALSE(row.text_field().fully_struck());
        CHECK(row.text_field().struck_length() == 0);
        CHECK(row.overlay().hidden);
        CHECK(row.text_field().alpha() == doctest::Approx(1.0f));
        CHECK(row.editable());
    }

    TEST_CASE("configure_overwrites_text_and_completed") {
        RowFixture fixture{{"Walk the dog", true}};
        CHECK(fixture.row.text() == "Walk the dog");
        CHECK(fixture.row.completed());

        fixture.row.configure({"Water plants", false});
        CHECK(fixture.row.text() == "Water plants");
        CHECK_FALSE(fixture.row.completed());
        CHECK(fixture.delegate->calls.empty());
    }

    TEST_CASE("background_color_round_trips") {
        RowFixture fixture;
        TR::UI::Color::Rgba blue{0.0f, 0.0f, 1.0f, 1.0f};
        fixture.row.set_background_color(blue);
        CHECK(fixture.row.background_color() == blue);
        CHECK(fixture.row.layers().layer(LayerKind::Content).background == blue);
    }

    TEST_CASE("prepare_for_reuse_resets_offset_and_alpha") {
        SUBCASE("mid_drag") {
            RowFixture fixture;
            fixture.row.handle_pan(PanPhase::Began, 0.0f);
            fixture.row.handle_pan(PanPhase::Changed, 55.0f);
            CHECK(fixture.row.content_offset() == doctest::Approx(55.0f));
            fixture.row.prepare_for_reuse();
            CHECK(fixture.row.content_offset() == doctest::Approx(0.0f));
            CHECK(fixture.row.alpha() == doctest::Approx(1.0f));
            CHECK(fixture.row.gesture_state() == RowGestureState::Idle);
            CHECK(fixture.row.release_intent() == ReleaseIntent::None);
        }
        SUBCASE("mid_delete_settle") {
            RowFixture fixture;
            fixture.swipe(-120.0f);
            fixture.animator.advance(std::chrono::milliseconds{100});
            CHECK(fixture.row.alpha() < 1.0f);
            fixture.row.prepare_for_reuse();
            CHECK(fixture.row.content_offset() == doctest::Approx(0.0f));
            CHECK(fixture.row.alpha() == doctest::Approx(1.0f));
            // The cancelled settle must not write stale values or notify later.
            CHECK(fixture.animator.finish_all());
            CHECK(fixture.row.content_offset() == doctest::Approx(0.0f));
            CHECK(fixture.row.alpha() == doctest::Approx(1.0f));
            CHECK(fixture.delegate->calls.empty());
        }
        SUBCASE("after_delete_finished") {
            RowFixture fixture;
            fixture.swipe(-80.0f);
            CHECK(fixture.animator.finish_all());
            CHECK(fixture.row.alpha() == doctest::Approx(0.0f));
            CHECK(fixture.row.delete_icon().alpha == doctest::Approx(1.0f));
            fixture.row.prepare_for_reuse();
            CHECK(fixture.row.content_offset() == doctest::Approx(0.0f));
            CHECK(fixture.row.alpha() == doctest::Approx(1.0f));
            CHECK(fixture.row.done_icon().alpha == doctest::Approx(0.0f));
            CHECK(fixture.row.delete_icon().alpha == doctest::Approx(0.0f));
        }
    }

    TEST_CASE("prepare_for_reuse_drops_in_flight_pointer_gesture") {
        RowFixture fixture;
        auto& row = fixture.row;
        row.pointer_down(160.0f, 30.0f);
        row.pointer_move(210.0f, 30.0f);
        REQUIRE(row.recognizer_state() == RecognizerState::Tracking);

        row.prepare_for_reuse();
        row.configure({"Other task", false});
        CHECK(row.recognizer_state() == RecognizerState::Idle);

        // The rest of the old gesture belongs to the previous task.
        row.pointer_move(250.0f, 30.0f);
        row.pointer_up(250.0f, 30.0f);
        CHECK(fixture.animator.finish_all());
        CHECK(fixture.delegate->calls.empty());
        CHECK_FALSE(row.completed());
        CHECK(row.content_offset() == doctest::Approx(0.0f));
        CHECK(row.gesture_state() == RowGestureState::Idle);
    }

    TEST_CASE("new_drag_supersedes_running_settle") {
        SUBCASE("reset_settle") {
            RowFixture fixture;
            auto& row = fixture.row;
            fixture.swipe(40.0f);
            REQUIRE(row.gesture_state() == RowGestureState::SettlingReset);
            fixture.animator.advance(std::chrono::milliseconds{50});

            row.handle_pan(PanPhase::Began, 0.0f);
            row.handle_pan(PanPhase::Changed, 90.0f);
            CHECK(row.content_offset() == doctest::Approx(90.0f));
            CHECK(fixture.animator.idle());

            fixture.animator.advance(std::chrono::milliseconds{16});
            CHECK(row.content_offset() == doctest::Approx(90.0f));
            CHECK(row.done_icon().alpha == doctest::Approx(1.0f));
            CHECK(row.gesture_state() == RowGestureState::Dragging);
            CHECK(row.release_intent() == ReleaseIntent::Complete);

            row.handle_pan(PanPhase::Ended, 90.0f);
            CHECK(fixture.animator.finish_all());
            REQUIRE(fixture.delegate->calls.size() == 1);
            CHECK(fixture.delegate->calls[0].name == "complete");
            CHECK(row.completed());
        }
        SUBCASE("complete_settle_commits_before_the_drag") {
            RowFixture fixture;
            auto& row = fixture.row;
            fixture.swipe(90.0f);
            fixture.animator.advance(std::chrono::milliseconds{50});
            CHECK(fixture.delegate->calls.empty());

            row.handle_pan(PanPhase::Began, 0.0f);
            REQUIRE(fixture.delegate->calls.size() == 1);
            CHECK(fixture.delegate->calls[0].name == "complete");
            CHECK(fixture.delegate->calls[0].completed);
            CHECK(row.completed());
            CHECK(row.text_field().alpha() == doctest::Approx(0.3f));

            row.handle_pan(PanPhase::Changed, 30.0f);
            CHECK(row.content_offset() == doctest::Approx(30.0f));
            row.handle_pan(PanPhase::Ended, 30.0f);
            CHECK(fixture.animator.finish_all());
            CHECK(fixture.delegate->calls.size() == 1);
            CHECK(row.completed());
            CHECK(row.content_offset() == doctest::Approx(0.0f));
        }
        SUBCASE("toggle_fade_is_snapped_and_notified_once") {
            RowFixture fixture;
            auto& row = fixture.row;
            fixture.swipe(90.0f);
            fixture.animator.advance(row.config().settle_duration);
            CHECK(row.completed());
            CHECK(fixture.delegate->calls.empty());

            row.handle_pan(PanPhase::Began, 0.0f);
            CHECK(row.text_field().alpha() == doctest::Approx(0.3f));
            row.handle_pan(PanPhase::Changed, 10.0f);
            row.handle_pan(PanPhase::Ended, 10.0f);
            CHECK(fixture.animator.finish_all());
            REQUIRE(fixture.delegate->calls.size() == 1);
            CHECK(fixture.delegate->calls[0].completed);
            CHECK(row.completed());
        }
        SUBCASE("delete_settle_takes_no_new_gesture") {
            RowFixture fixture;
            auto& row = fixture.row;
            fixture.swipe(-90.0f);
            fixture.animator.advance(std::chrono::milliseconds{50});
            CHECK_FALSE(row.should_begin_gesture(40.0f, 0.0f));

            row.handle_pan(PanPhase::Began, 0.0f);
            row.handle_pan(PanPhase::Changed, 40.0f);
            CHECK(row.gesture_state() == RowGestureState::SettlingDelete);
            CHECK(fixture.animator.finish_all());
            REQUIRE(fixture.delegate->calls.size() == 1);
            CHECK(fixture.delegate->calls[0].name == "delete");
        }
    }

    TEST_CASE("exact_threshold_commits_complete") {
        RowFixture fixture;
        fixture.row.handle_pan(PanPhase::Began, 0.0f);
        fixture.row.handle_pan(PanPhase::Changed, 80.0f);
        CHECK(fixture.row.release_intent() == ReleaseIntent::Complete);
        fixture.row.handle_pan(PanPhase::Ended, 80.0f);
        CHECK(fixture.row.gesture_state() == RowGestureState::SettlingComplete);

        CHECK(fixture.animator.finish_all());
        REQUIRE(fixture.delegate->calls.size() == 1);
        CHECK(fixture.delegate->calls[0].name == "complete");
        CHECK(fixture.delegate->calls[0].completed);
        CHECK(fixture.row.completed());
        CHECK(fixture.row.gesture_state() == RowGestureState::Idle);
        CHECK(fixture.row.content_offset() == doctest::Approx(0.0f));
        CHECK(fixture.row.text_field().alpha() == doctest::Approx(0.3f));
        CHECK_FALSE(fixture.row.overlay().hidden);
        CHECK_FALSE(fixture.row.editable());
    }

    TEST_CASE("exact_negative_threshold_commits_delete") {
        RowFixture fixture;
        fixture.swipe(-80.0f);
        CHECK(fixture.row.gesture_state() == RowGestureState::SettlingDelete);
        CHECK(fixture.animator.finish_all());

        REQUIRE(fixture.delegate->calls.size() == 1);
        CHECK(fixture.delegate->calls[0].name == "delete");
        CHECK(fixture.row.alpha() == doctest::Approx(0.0f));
        // Slid past the delete icon: -(width + threshold).
        CHECK(fixture.row.content_offset() == doctest::Approx(-400.0f));
        CHECK(fixture.row.delete_icon().frame.min_x == doctest::Approx(260.0f));
        CHECK(fixture.row.done_icon().frame.min_x == doctest::Approx(20.0f));
        CHECK(fixture.row.gesture_state() == RowGestureState::Idle);
        CHECK_FALSE(fixture.row.completed());
    }

    TEST_CASE("just_below_threshold_settles_back") {
        RowFixture fixture;
        fixture.swipe(79.0f);
        CHECK(fixture.row.release_intent() == ReleaseIntent::None);
        CHECK(fixture.row.gesture_state() == RowGestureState::SettlingReset);
        CHECK(fixture.animator.finish_all());
        CHECK(fixture.delegate->calls.empty());
        CHECK(fixture.row.content_offset() == doctest::Approx(0.0f));
        CHECK_FALSE(fixture.row.completed());
        CHECK(fixture.row.gesture_state() == RowGestureState::Idle);
    }

    TEST_CASE("completed_row_swiped_right_uncompletes") {
        RowFixture fixture{{"Buy milk", true}};
        fixture.swipe(80.0f);
        CHECK(fixture.animator.finish_all());
        REQUIRE(fixture.delegate->calls.size() == 1);
        CHECK(fixture.delegate->calls[0].name == "complete");
        CHECK_FALSE(fixture.delegate->calls[0].completed);
        CHECK_FALSE(fixture.row.completed());
        CHECK(fixture.row.text_field().alpha() == doctest::Approx(1.0f));
        CHECK(fixture.row.overlay().hidden);
        CHECK(fixture.row.text_field().struck_length() == 0);
    }

    TEST_CASE("short_swipe_returns_to_rest_without_notification") {
        RowFixture fixture;
        fixture.row.handle_pan(PanPhase::Began, 0.0f);
        fixture.row.handle_pan(PanPhase::Changed, 40.0f);
        CHECK(fixture.row.done_icon().alpha == doctest::Approx(0.5f));
        CHECK(fixture.row.delete_icon().alpha == doctest::Approx(0.5f));
        fixture.row.handle_pan(PanPhase::Ended, 40.0f);

        fixture.animator.advance(std::chrono::milliseconds{100});
        CHECK(fixture.row.content_offset() > 0.0f);
        CHECK(fixture.row.content_offset() < 40.0f);
        CHECK(fixture.row.done_icon().alpha < 0.5f);

        CHECK(fixture.animator.finish_all());
        CHECK(fixture.delegate->calls.empty());
        CHECK(fixture.row.content_offset() == doctest::Approx(0.0f));
        CHECK(fixture.row.done_icon().alpha == doctest::Approx(0.0f));
        CHECK(fixture.row.delete_icon().alpha == doctest::Approx(0.0f));
    }

    TEST_CASE("intent_is_recomputed_every_sample") {
        RowFixture fixture;
        fixture.row.handle_pan(PanPhase::Began, 0.0f);
        fixture.row.handle_pan(PanPhase::Changed, 95.0f);
        CHECK(fixture.row.release_intent() == ReleaseIntent::Complete);
        fixture.row.handle_pan(PanPhase::Changed, 50.0f);
        CHECK(fixture.row.release_intent() == ReleaseIntent::None);
        fixture.row.handle_pan(PanPhase::Changed, -90.0f);
        CHECK(fixture.row.release_intent() == ReleaseIntent::Delete);
        fixture.row.handle_pan(PanPhase::Changed, -10.0f);
        fixture.row.handle_pan(PanPhase::Ended, -10.0f);
        CHECK(fixture.animator.finish_all());
        CHECK(fixture.delegate->calls.empty());
    }

    TEST_CASE("icons_trail_content_past_threshold") {
        RowFixture fixture;
        auto& row = fixture.row;
        row.handle_pan(PanPhase::Began, 0.0f);

        row.handle_pan(PanPhase::Changed, 60.0f);
        CHECK(row.done_icon().frame.min_x == doctest::Approx(20.0f));
        CHECK(row.delete_icon().frame.min_x == doctest::Approx(260.0f));

        row.handle_pan(PanPhase::Changed, 100.0f);
        CHECK(row.content_offset() == doctest::Approx(100.0f));
        CHECK(row.done_icon().frame.min_x == doctest::Approx(40.0f));
        CHECK(row.done_icon().alpha == doctest::Approx(1.0f));

        row.handle_pan(PanPhase::Changed, -100.0f);
        CHECK(row.delete_icon().frame.min_x == doctest::Approx(240.0f));
        CHECK(row.delete_icon().alpha == doctest::Approx(1.0f));
    }

    TEST_CASE("drag_previews_strike_on_open_row") {
        RowFixture fixture{{"abcdefgh", false}};
        auto& row = fixture.row;
        row.handle_pan(PanPhase::Began, 0.0f);

        row.handle_pan(PanPhase::Changed, 40.0f);
        CHECK(row.text_field().struck_length() == 4);
        CHECK(row.overlay().hidden);

        row.handle_pan(PanPhase::Changed, 80.0f);
        CHECK(row.text_field().fully_struck());
        CHECK_FALSE(row.overlay().hidden);
        CHECK(row.overlay().background == row.config().colors.complete_green);

        row.handle_pan(PanPhase::Changed, -40.0f);
        CHECK(row.text_field().struck_length() == 0);
        CHECK(row.overlay().hidden);

        row.handle_pan(PanPhase::Changed, 40.0f);
        row.handle_pan(PanPhase::Ended, 40.0f);
        CHECK(row.text_field().struck_length() == 0);
    }

    TEST_CASE("drag_previews_unstrike_on_completed_row") {
        RowFixture fixture{{"abcdefgh", true}};
        auto& row = fixture.row;
        row.handle_pan(PanPhase::Began, 0.0f);

        row.handle_pan(PanPhase::Changed, 40.0f);
        CHECK(row.text_field().struck_length() == 4);
        CHECK_FALSE(row.overlay().hidden);
        CHECK(row.text_field().alpha() == doctest::Approx(0.3f));

        row.handle_pan(PanPhase::Changed, 80.0f);
        CHECK(row.text_field().struck_length() == 0);
        CHECK(row.overlay().hidden);
        CHECK(row.text_field().alpha() == doctest::Approx(1.0f));

        row.handle_pan(PanPhase::Changed, -40.0f);
        CHECK(row.text_field().fully_struck());
        CHECK_FALSE(row.overlay().hidden);
        CHECK(row.text_field().alpha() == doctest::Approx(0.3f));

        row.handle_pan(PanPhase::Changed, 40.0f);
        row.handle_pan(PanPhase::Ended, 40.0f);
        CHECK(row.text_field().fully_struck());
        CHECK(fixture.animator.finish_all());
        CHECK(row.completed());
        CHECK(fixture.delegate->calls.empty());
    }

    TEST_CASE("cancelled_pan_restores_row") {
        RowFixture fixture;
        auto& row = fixture.row;
        row.handle_pan(PanPhase::Began, 0.0f);
        row.handle_pan(PanPhase::Changed, 90.0f);
        CHECK_FALSE(row.overlay().hidden);
        row.handle_pan(PanPhase::Cancelled, 90.0f);
        CHECK(row.gesture_state() == RowGestureState::SettlingReset);
        CHECK(row.release_intent() == ReleaseIntent::None);
        CHECK(row.overlay().hidden);
        CHECK(row.text_field().struck_length() == 0);
        CHECK(fixture.animator.finish_all());
        CHECK(row.content_offset() == doctest::Approx(0.0f));
        CHECK(fixture.delegate->calls.empty());
    }

    TEST_CASE("pointer_samples_drive_the_recognizer") {
        SUBCASE("horizontal_swipe_completes") {
            RowFixture fixture;
            fixture.pointer_swipe(120.0f, 5.0f);
            CHECK(fixture.row.recognizer_state() == RecognizerState::Idle);
            CHECK(fixture.animator.finish_all());
            REQUIRE(fixture.delegate->calls.size() == 1);
            CHECK(fixture.delegate->calls[0].name == "complete");
        }
        SUBCASE("vertical_drag_is_not_claimed") {
            RowFixture fixture;
            auto& row = fixture.row;
            row.pointer_down(100.0f, 30.0f);
            row.pointer_move(102.0f, 40.0f);
            CHECK(row.recognizer_state() == RecognizerState::Failed);
            row.pointer_move(250.0f, 40.0f);
            CHECK(row.gesture_state() == RowGestureState::Idle);
            CHECK(row.content_offset() == doctest::Approx(0.0f));
            row.pointer_up(250.0f, 40.0f);
            CHECK(fixture.animator.idle());
            CHECK(fixture.delegate->calls.empty());
        }
        SUBCASE("cancel_pointer_settles_back") {
            RowFixture fixture;
            auto& row = fixture.row;
            row.pointer_down(100.0f, 30.0f);
            row.pointer_move(200.0f, 30.0f);
            CHECK(row.gesture_state() == RowGestureState::Dragging);
            row.cancel_pointer();
            CHECK(fixture.animator.finish_all());
            CHECK(row.content_offset() == doctest::Approx(0.0f));
            CHECK(fixture.delegate->calls.empty());
        }
    }

    TEST_CASE("gesture_is_rejected_while_text_is_edited") {
        RowFixture fixture;
        auto& row = fixture.row;
        CHECK(row.become_first_responder());
        REQUIRE(row.text_field().is_editing());
        CHECK_FALSE(row.should_begin_gesture(50.0f, 0.0f));

        row.pointer_down(100.0f, 30.0f);
        row.pointer_move(180.0f, 30.0f);
        CHECK(row.recognizer_state() == RecognizerState::Failed);
        CHECK(row.gesture_state() == RowGestureState::Idle);
        CHECK(row.content_offset() == doctest::Approx(0.0f));
        CHECK(row.text_field().is_editing());
    }

    TEST_CASE("claim_rule_requires_horizontal_dominance") {
        RowFixture fixture;
        CHECK(fixture.row.should_begin_gesture(5.0f, 1.0f));
        CHECK(fixture.row.should_begin_gesture(-5.0f, 4.0f));
        CHECK_FALSE(fixture.row.should_begin_gesture(3.0f, 3.0f));
        CHECK_FALSE(fixture.row.should_begin_gesture(1.0f, -6.0f));
    }

    TEST_CASE("began_releases_text_focus") {
        RowFixture fixture;
        auto& row = fixture.row;
        CHECK(row.become_first_responder());
        CHECK(fixture.delegate->count("begin_editing") == 1);

        // A host-owned recognizer can still start a pan; Began ends the edit.
        row.handle_pan(PanPhase::Began, 0.0f);
        CHECK(fixture.focus.first_responder() == nullptr);
        CHECK_FALSE(row.text_field().is_editing());
        CHECK(fixture.delegate->count("end_editing") == 1);
    }

    TEST_CASE("become_first_responder_is_a_one_shot_override") {
        RowFixture fixture;
        auto& row = fixture.row;
        CHECK(row.accepts_first_mouse());
        CHECK_FALSE(row.text_field().accepts_first_mouse());
        CHECK_FALSE(row.text_field().become_first_responder());
        CHECK_FALSE(row.text_field().is_editing());

        CHECK(row.become_first_responder());
        CHECK(row.text_field().is_editing());
        CHECK_FALSE(row.text_field().accepts_first_responder());
    }

    TEST_CASE("text_edits_are_forwarded_to_delegate") {
        RowFixture fixture;
        auto& row = fixture.row;
        CHECK(row.become_first_responder());
        auto edited = row.text_field().replace_text("Buy oat milk");
        REQUIRE(edited.has_value());
        CHECK(row.text() == "Buy oat milk");
        fixture.focus.clear();

        REQUIRE(fixture.delegate->calls.size() == 3);
        CHECK(fixture.delegate->calls[0].name == "begin_editing");
        CHECK(fixture.delegate->calls[1].name == "change_text");
        CHECK(fixture.delegate->calls[2].name == "end_editing");
    }

    TEST_CASE("cleared_delegate_is_tolerated") {
        RowFixture fixture;
        fixture.delegate.reset();
        fixture.swipe(100.0f);
        CHECK(fixture.animator.finish_all());
        CHECK(fixture.row.completed());
        fixture.swipe(-100.0f);
        CHECK(fixture.animator.finish_all());
        CHECK(fixture.row.alpha() == doctest::Approx(0.0f));
    }

    TEST_CASE("delegate_may_destroy_rows_on_delete") {
        class Remover final : public RowDelegate {
        public:
            explicit Remover(std::vector<std::unique_ptr<SwipeableRow>>& rows) : rows_(rows) {}
            auto row_did_complete(SwipeableRow&, bool) -> void override {}
            auto row_did_request_delete(SwipeableRow& row) -> void override {
                std::erase_if(rows_, [&](std::unique_ptr<SwipeableRow> const& owned) { return owned.get() == &row; });
                ++deleted;
            }
            auto row_did_begin_editing(SwipeableRow&) -> void override {}
            auto row_did_change_text(SwipeableRow&) -> void override {}
            auto row_did_end_editing(SwipeableRow&) -> void override {}
            int deleted = 0;

        private:
            std::vector<std::unique_ptr<SwipeableRow>>& rows_;
        };

        FocusScope focus;
        SettleAnimator animator;
        std::vector<std::unique_ptr<SwipeableRow>> rows;
        auto remover = std::make_shared<Remover>(rows);
        for (auto const* id : {"a", "b", "c"}) {
            rows.push_back(std::make_unique<SwipeableRow>(id, RowHost{focus, animator}));
            rows.back()->set_delegate(remover);
        }

        for (auto id : {0, 1}) {
            auto& row = *rows[static_cast<std::size_t>(id)];
            row.handle_pan(PanPhase::Began, 0.0f);
            row.handle_pan(PanPhase::Changed, -90.0f);
            row.handle_pan(PanPhase::Ended, -90.0f);
        }
        CHECK(animator.finish_all());
        CHECK(remover->deleted == 2);
        REQUIRE(rows.size() == 1);
        CHECK(rows[0]->identifier() == "c");
    }

    TEST_CASE("resize_keeps_delete_icon_on_trailing_edge") {
        RowFixture fixture;
        CHECK(fixture.row.delete_icon().frame.min_x == doctest::Approx(260.0f));
        fixture.row.resize(400.0f, 60.0f);
        CHECK(fixture.row.width() == doctest::Approx(400.0f));
        CHECK(fixture.row.delete_icon().frame.min_x == doctest::Approx(340.0f));
        CHECK(fixture.row.done_icon().frame.min_x == doctest::Approx(20.0f));
        auto const text = fixture.row.layers().absolute_frame(LayerKind::Text);
        CHECK(text.min_x == doctest::Approx(8.0f));
        CHECK(text.max_x == doctest::Approx(392.0f));
        CHECK(text.min_y == doctest::Approx(14.0f));
    }

    TEST_CASE("restore_is_not_supported") {
        FocusScope focus;
        SettleAnimator animator;
        auto restored = SwipeableRow::Restore(nlohmann::json::object(), RowHost{focus, animator});
        REQUIRE_FALSE(restored.has_value());
        CHECK(restored.error().code == TR::Error::Code::NotSupported);
    }

    TEST_CASE("state_names") {
        CHECK(RowGestureStateToString(RowGestureState::SettlingDelete) == "settling_delete");
        CHECK(RowGestureStateToString(RowGestureState::Idle) == "idle");
    }
}
