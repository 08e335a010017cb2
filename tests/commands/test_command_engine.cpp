/**
 * test_command_engine.cpp - Keyword rule tests
 */

#include "aegis/commands/CommandEngine.hpp"
#include "common/Fakes.hpp"

#include <cassert>
#include <cstdio>
#include <iostream>
#include <string>
#include <unistd.h>

using namespace aegis;
using namespace aegis::commands;
using namespace aegis::testing;

namespace {

std::string tempNotesPath(const char* name) {
    std::string path = "/tmp/aegis_" + std::string(name) + "_" + std::to_string(getpid()) + ".json";
    std::remove(path.c_str());
    return path;
}

CommandConfig testConfig() {
    CommandConfig config;
    config.owner_name = "Sam";
    config.wake_phrase = "Vortex";
    config.apps = {
        {"firefox", "firefox --new-window"},
        {"terminal", "gnome-terminal"},
        {"code", "code"},
        {"calculator", "gnome-calculator"},
    };
    config.aliases = {
        {"browser", "firefox"},
        {"vs code", "code"},
        {"editor", "code"},
    };
    return config;
}

} // anonymous namespace

void test_security_directives() {
    FakeLauncher launcher;
    NoteStore notes(tempNotesPath("sec"));
    CommandEngine engine(testConfig(), launcher, notes);

    auto up = engine.dispatch("Enter security mode");
    assert(up.intent == Intent::SecurityMode);
    assert(up.security == SecurityDirective::Elevate);
    assert(up.intent_executed);
    assert(!up.spoken_message.empty());

    auto alert = engine.dispatch("security alert, someone is here");
    assert(alert.security == SecurityDirective::Elevate);

    auto down = engine.dispatch("Return to normal mode");
    assert(down.intent == Intent::NormalMode);
    assert(down.security == SecurityDirective::Normalize);

    auto stand = engine.dispatch("stand down");
    assert(stand.security == SecurityDirective::Normalize);

    std::cout << "[PASS] test_security_directives" << std::endl;
}

void test_open_and_close_apps() {
    FakeLauncher launcher;
    NoteStore notes(tempNotesPath("apps"));
    CommandEngine engine(testConfig(), launcher, notes);

    auto open = engine.dispatch("Open the browser please");
    assert(open.intent == Intent::OpenApp);
    assert(open.intent_executed);
    assert(open.spoken_message == "Opening firefox for you.");
    assert(launcher.launched.size() == 1);
    assert(launcher.launched[0].size() == 2);
    assert(launcher.launched[0][0] == "firefox");
    assert(launcher.launched[0][1] == "--new-window");

    auto close = engine.dispatch("close the browser");
    assert(close.intent == Intent::CloseApp);
    assert(close.intent_executed);
    assert(close.spoken_message == "Closing firefox for you.");
    assert(launcher.terminated.size() == 1);
    assert(launcher.terminated[0] == 4242);

    // Already closed
    auto again = engine.dispatch("close firefox");
    assert(again.intent == Intent::CloseApp);
    assert(!again.intent_executed);
    assert(again.spoken_message == "firefox isn't running.");

    std::cout << "[PASS] test_open_and_close_apps" << std::endl;
}

void test_longest_alias_wins() {
    FakeLauncher launcher;
    NoteStore notes(tempNotesPath("alias"));
    CommandEngine engine(testConfig(), launcher, notes);

    assert(engine.findApp("open vs code") == std::optional<std::string>("code"));
    assert(engine.findApp("launch the editor") == std::optional<std::string>("code"));
    assert(engine.findApp("start the calculator") == std::optional<std::string>("calculator"));
    assert(!engine.findApp("open the pod bay doors"));

    auto result = engine.dispatch("Launch VS Code");
    assert(result.intent == Intent::OpenApp);
    assert(launcher.launched.back()[0] == "code");

    std::cout << "[PASS] test_longest_alias_wins" << std::endl;
}

void test_launch_failure() {
    FakeLauncher launcher;
    launcher.fail = true;
    NoteStore notes(tempNotesPath("fail"));
    CommandEngine engine(testConfig(), launcher, notes);

    auto result = engine.dispatch("open terminal");
    assert(result.intent == Intent::OpenApp);
    assert(!result.intent_executed);
    assert(result.error == ErrorKind::CollaboratorError);
    assert(result.spoken_message == "I couldn't open terminal.");

    // Nothing recorded as running
    auto close = engine.dispatch("close terminal");
    assert(!close.intent_executed);
    assert(launcher.terminated.empty());

    std::cout << "[PASS] test_launch_failure" << std::endl;
}

void test_notes_and_recall() {
    std::string path = tempNotesPath("notes");
    FakeLauncher launcher;
    {
        NoteStore notes(path);
        CommandEngine engine(testConfig(), launcher, notes);

        auto empty = engine.dispatch("What do you remember?");
        assert(empty.intent == Intent::Recall);
        assert(empty.spoken_message == "You haven't asked me to remember anything yet.");

        auto first = engine.dispatch("Remember that the keys are in the drawer");
        assert(first.intent == Intent::Note);
        assert(first.intent_executed);
        assert(first.spoken_message == "I'll remember that: the keys are in the drawer");

        auto second = engine.dispatch("take a note that Buy Milk");
        assert(second.spoken_message == "I'll remember that: Buy Milk");

        auto blank = engine.dispatch("remember");
        assert(blank.intent == Intent::Note);
        assert(!blank.intent_executed);
        assert(notes.size() == 2);
    }

    // Notes persist across instances
    NoteStore reloaded(path);
    assert(reloaded.size() == 2);
    auto recent = reloaded.recent(3);
    assert(recent[0].id == 1);
    assert(recent[1].text == "Buy Milk");

    CommandEngine engine(testConfig(), launcher, reloaded);
    auto recall = engine.dispatch("read my notes");
    assert(recall.intent == Intent::Recall);
    assert(recall.spoken_message ==
           "You asked me to remember: the keys are in the drawer; Buy Milk.");

    std::remove(path.c_str());
    std::cout << "[PASS] test_notes_and_recall" << std::endl;
}

void test_note_write_failure() {
    FakeLauncher launcher;
    NoteStore notes("/proc/aegis_no_such_dir/notes.json");
    CommandEngine engine(testConfig(), launcher, notes);

    auto result = engine.dispatch("note that this cannot be saved");
    assert(result.intent == Intent::Note);
    assert(!result.intent_executed);
    assert(result.error == ErrorKind::CollaboratorError);
    assert(notes.size() == 0);

    std::cout << "[PASS] test_note_write_failure" << std::endl;
}

void test_smalltalk_and_time() {
    FakeLauncher launcher;
    NoteStore notes(tempNotesPath("talk"));
    CommandEngine engine(testConfig(), launcher, notes);

    auto wake = engine.dispatch("vortex");
    assert(wake.intent == Intent::Smalltalk);
    assert(wake.spoken_message == "You called, Sam. I'm listening.");

    auto how = engine.dispatch("How are you?");
    assert(how.intent == Intent::Smalltalk);

    auto time = engine.dispatch("What time is it?");
    assert(time.intent == Intent::Time);
    assert(time.intent_executed);
    assert(time.spoken_message.rfind("It is ", 0) == 0);
    assert(time.spoken_message.size() == std::string("It is 12:00.").size());

    std::cout << "[PASS] test_smalltalk_and_time" << std::endl;
}

void test_unknown() {
    FakeLauncher launcher;
    NoteStore notes(tempNotesPath("unknown"));
    CommandEngine engine(testConfig(), launcher, notes);

    auto unknown = engine.dispatch("sing me a song");
    assert(unknown.intent == Intent::Unknown);
    assert(!unknown.intent_executed);
    assert(unknown.error == ErrorKind::None);
    assert(!unknown.spoken_message.empty());

    // "note pad" is not a note request, and no app is configured for it
    auto pad = engine.dispatch("open note pad");
    assert(pad.intent == Intent::Unknown);
    assert(notes.size() == 0);
    assert(launcher.launched.empty());

    auto blank = engine.dispatch("   ");
    assert(blank.intent == Intent::Unknown);
    assert(!blank.intent_executed);

    std::cout << "[PASS] test_unknown" << std::endl;
}

int main() {
    std::cout << "=== CommandEngine Tests ===" << std::endl;

    test_security_directives();
    test_open_and_close_apps();
    test_longest_alias_wins();
    test_launch_failure();
    test_notes_and_recall();
    test_note_write_failure();
    test_smalltalk_and_time();
    test_unknown();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
