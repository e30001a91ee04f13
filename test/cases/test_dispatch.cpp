#include <catch2/catch.hpp>
#include <fsm/fsm.hpp>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

enum class State { Red, Green };
enum class Event { Toggle, Ping, Self };

enum class CallType { Exit, DefaultExit, Action, Entry, DefaultEntry };

struct CallRecord {
	CallType type;
	State    state;  // Current state observed by the call
	int      arg;

	bool operator==(const CallRecord& other) const { return type == other.type && state == other.state && arg == other.arg; }
};

std::ostream& operator<<(std::ostream& os, const CallRecord& record) {
	os << "{ ";
	switch (record.type) {
		case CallType::Exit: os << "Exit"; break;
		case CallType::DefaultExit: os << "DefaultExit"; break;
		case CallType::Action: os << "Action"; break;
		case CallType::Entry: os << "Entry"; break;
		case CallType::DefaultEntry: os << "DefaultEntry"; break;
	}
	os << ", " << (record.state == State::Red ? "Red" : "Green") << ", " << record.arg << " }";
	return os;
}

struct TestContext;

struct TestTraits {
	using Context = TestContext;
	using State   = ::State;
	using Event   = ::Event;
};

using Builder  = fsm::Builder<TestTraits, int>;
using Instance = fsm::Instance<TestTraits, int>;

struct TestContext {
	std::vector<CallRecord> calls;
	std::vector<State>      changes;  // (from, to) pairs seen by hooks
	const Instance*         machine = nullptr;

	bool fail_exit   = false;
	bool fail_action = false;
	bool fail_entry  = false;

	void log(CallType type, int arg) { calls.push_back({type, machine->current_state(), arg}); }
	void clear() {
		calls.clear();
		changes.clear();
	}
};

Builder make_builder() {
	Builder b;
	b.transition(State::Red, Event::Toggle, State::Green, [](TestContext& c, int arg) {
		if (c.fail_action) { throw std::runtime_error("action failed"); }
		c.log(CallType::Action, arg);
	});
	b.transition(State::Green, Event::Toggle, State::Red, [](TestContext& c, int arg) { c.log(CallType::Action, arg); });
	b.transition(State::Green, Event::Self, State::Green, [](TestContext& c, int arg) { c.log(CallType::Action, arg); });
	b.transition(State::Red, Event::Ping, [](TestContext& c, int arg) { c.log(CallType::Action, arg); });
	b.transition(State::Red, Event::Self, nullptr);

	b.exit(State::Red, [](TestContext& c, State from, State to, int arg) {
		if (c.fail_exit) { throw std::runtime_error("exit failed"); }
		c.changes.push_back(from);
		c.changes.push_back(to);
		c.log(CallType::Exit, arg);
	});
	b.entry(State::Green, [](TestContext& c, State from, State to, int arg) {
		if (c.fail_entry) { throw std::runtime_error("entry failed"); }
		c.changes.push_back(from);
		c.changes.push_back(to);
		c.log(CallType::Entry, arg);
	});
	b.default_exit([](TestContext& c, State, State, int arg) { c.log(CallType::DefaultExit, arg); });
	b.default_entry([](TestContext& c, State, State, int arg) { c.log(CallType::DefaultEntry, arg); });
	return b;
}

}  // namespace

TEST_CASE("External transition ordering", "[dispatch]") {
	auto        def = make_builder().complete();
	TestContext ctx;
	auto        machine = def.create(ctx, State::Red);
	ctx.machine         = &machine;

	SECTION("Exit hooks, action, state change, entry hooks") {
		machine.send_event(Event::Toggle, 7);

		REQUIRE(ctx.calls.size() == 5);
		CHECK(ctx.calls[0] == CallRecord{CallType::Exit, State::Red, 7});
		CHECK(ctx.calls[1] == CallRecord{CallType::DefaultExit, State::Red, 7});
		CHECK(ctx.calls[2] == CallRecord{CallType::Action, State::Red, 7});
		CHECK(ctx.calls[3] == CallRecord{CallType::Entry, State::Green, 7});
		CHECK(ctx.calls[4] == CallRecord{CallType::DefaultEntry, State::Green, 7});
		CHECK(ctx.changes == std::vector<State>{State::Red, State::Green, State::Red, State::Green});
		CHECK(machine.current_state() == State::Green);
	}

	SECTION("Global hooks run when no state specific hook exists") {
		machine.send_event(Event::Toggle, 1);
		ctx.clear();

		machine.send_event(Event::Toggle, 2);
		REQUIRE(ctx.calls.size() == 3);
		CHECK(ctx.calls[0] == CallRecord{CallType::DefaultExit, State::Green, 2});
		CHECK(ctx.calls[1] == CallRecord{CallType::Action, State::Green, 2});
		CHECK(ctx.calls[2] == CallRecord{CallType::DefaultEntry, State::Red, 2});
		CHECK(machine.current_state() == State::Red);
	}

	SECTION("Same state target is still an external transition") {
		machine.send_event(Event::Toggle, 1);
		ctx.clear();

		machine.send_event(Event::Self, 3);
		REQUIRE(ctx.calls.size() == 4);
		CHECK(ctx.calls[0] == CallRecord{CallType::DefaultExit, State::Green, 3});
		CHECK(ctx.calls[1] == CallRecord{CallType::Action, State::Green, 3});
		CHECK(ctx.calls[2] == CallRecord{CallType::Entry, State::Green, 3});
		CHECK(ctx.calls[3] == CallRecord{CallType::DefaultEntry, State::Green, 3});
		CHECK(ctx.changes == std::vector<State>{State::Green, State::Green});
	}
}

TEST_CASE("Internal transitions", "[dispatch]") {
	auto        def = make_builder().complete();
	TestContext ctx;
	auto        machine = def.create(ctx, State::Red);
	ctx.machine         = &machine;

	machine.send_event(Event::Ping, 4);
	REQUIRE(ctx.calls.size() == 1);
	CHECK(ctx.calls[0] == CallRecord{CallType::Action, State::Red, 4});
	CHECK(machine.current_state() == State::Red);

	SECTION("Without an action nothing runs") {
		ctx.clear();
		machine.send_event(Event::Self, 5);
		CHECK(ctx.calls.empty());
		CHECK(machine.current_state() == State::Red);
	}
}

TEST_CASE("Default actions never run hooks", "[dispatch]") {
	struct Seen {
		State state;
		Event event;
		int   arg;
	};

	std::vector<Seen> seen;
	Builder           b = make_builder();
	b.default_action([&seen](TestContext&, State s, Event e, int arg) { seen.push_back({s, e, arg}); });
	auto def = b.complete();

	TestContext ctx;
	auto        machine = def.create(ctx, State::Green);
	ctx.machine         = &machine;

	machine.send_event(Event::Ping, 9);
	CHECK(ctx.calls.empty());
	CHECK(machine.current_state() == State::Green);
	REQUIRE(seen.size() == 1);
	CHECK(seen[0].state == State::Green);
	CHECK(seen[0].event == Event::Ping);
	CHECK(seen[0].arg == 9);
}

TEST_CASE("Failures in user code propagate", "[dispatch]") {
	auto        def = make_builder().complete();
	TestContext ctx;
	auto        machine = def.create(ctx, State::Red);
	ctx.machine         = &machine;

	SECTION("Failing exit hook stops the dispatch") {
		ctx.fail_exit = true;
		REQUIRE_THROWS_WITH(machine.send_event(Event::Toggle, 1), "exit failed");
		CHECK(ctx.calls.empty());
		CHECK(machine.current_state() == State::Red);
	}

	SECTION("Failing action leaves the state unchanged") {
		ctx.fail_action = true;
		REQUIRE_THROWS_WITH(machine.send_event(Event::Toggle, 1), "action failed");
		REQUIRE(ctx.calls.size() == 2);
		CHECK(ctx.calls[1].type == CallType::DefaultExit);
		CHECK(machine.current_state() == State::Red);
	}

	SECTION("Failing entry hook keeps the new state") {
		ctx.fail_entry = true;
		REQUIRE_THROWS_WITH(machine.send_event(Event::Toggle, 1), "entry failed");
		REQUIRE(ctx.calls.size() == 3);
		CHECK(ctx.calls[2].type == CallType::Action);
		CHECK(machine.current_state() == State::Green);
	}

	SECTION("Failing guard rejects nothing and changes nothing") {
		Builder b;
		b.transition(State::Red, Event::Toggle, State::Green, [](TestContext&, int) -> bool { throw std::logic_error("guard failed"); },
		             nullptr);
		auto guarded = b.complete().create(ctx, State::Red);
		REQUIRE_THROWS_AS(guarded.send_event(Event::Toggle, 0), std::logic_error);
		CHECK(guarded.current_state() == State::Red);
	}
}

TEST_CASE("Call arguments reach guards and actions", "[dispatch]") {
	struct Account {
		int balance = 0;
	};
	struct AccountTraits {
		using Context = Account;
		using State   = ::State;
		using Event   = ::Event;
	};

	fsm::Builder<AccountTraits, int, const std::string&> b;
	std::vector<std::string>                             memo;
	b.transition(State::Red, Event::Ping, [](Account& a, int amount, const std::string&) { return a.balance + amount >= 0; },
	             [&memo](Account& a, int amount, const std::string& note) {
		             a.balance += amount;
		             memo.push_back(note);
	             });
	auto def = b.complete();

	Account account;
	auto    machine = def.create(account, State::Red);

	machine.send_event(Event::Ping, 10, "deposit");
	machine.send_event(Event::Ping, -4, "withdraw");
	REQUIRE_THROWS_AS(machine.send_event(Event::Ping, -20, "overdraw"), fsm::EventNotAllowed);

	CHECK(account.balance == 6);
	CHECK(memo == std::vector<std::string>{"deposit", "withdraw"});
}

TEST_CASE("Default transitions", "[dispatch]") {
	Builder b;
	b.transition(State::Red, Event::Toggle, State::Red, [](TestContext&, int arg) { return arg > 100; }, nullptr);
	b.default_transition(Event::Toggle, State::Green, [](TestContext& c, int arg) { c.log(CallType::Action, arg); });
	b.default_transition(Event::Ping, [](TestContext& c, int arg) { c.log(CallType::Action, arg); });
	b.exit(State::Red, [](TestContext& c, State, State, int arg) { c.log(CallType::Exit, arg); });
	b.entry(State::Green, [](TestContext& c, State, State, int arg) { c.log(CallType::Entry, arg); });
	auto def = b.complete();

	TestContext ctx;
	auto        machine = def.create(ctx, State::Red);
	ctx.machine         = &machine;

	SECTION("Failing guards fall through to the external default transition") {
		machine.send_event(Event::Toggle, 1);

		REQUIRE(ctx.calls.size() == 3);
		CHECK(ctx.calls[0] == CallRecord{CallType::Exit, State::Red, 1});
		CHECK(ctx.calls[1] == CallRecord{CallType::Action, State::Red, 1});
		CHECK(ctx.calls[2] == CallRecord{CallType::Entry, State::Green, 1});
		CHECK(machine.current_state() == State::Green);
	}

	SECTION("A passing guard wins over the default transition") {
		machine.send_event(Event::Toggle, 200);

		REQUIRE(ctx.calls.size() == 1);
		CHECK(ctx.calls[0] == CallRecord{CallType::Exit, State::Red, 200});
		CHECK(machine.current_state() == State::Red);
	}

	SECTION("Internal default transition runs no hooks") {
		machine.send_event(Event::Ping, 2);
		REQUIRE(ctx.calls.size() == 1);
		CHECK(ctx.calls[0] == CallRecord{CallType::Action, State::Red, 2});
		CHECK(machine.current_state() == State::Red);

		machine.send_event(Event::Toggle, 1);
		ctx.clear();

		machine.send_event(Event::Ping, 3);
		REQUIRE(ctx.calls.size() == 1);
		CHECK(ctx.calls[0] == CallRecord{CallType::Action, State::Green, 3});
		CHECK(machine.current_state() == State::Green);
	}
}
