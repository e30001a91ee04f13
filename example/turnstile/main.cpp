#include <cstdio>
#include <fsm/fsm.hpp>

// 1. Define the context the actions operate on
struct Turnstile {
	bool locked = true;

	void unlock() {
		locked = false;
		printf("  unlock\n");
	}
	void lock() {
		locked = true;
		printf("  lock\n");
	}
	void thank_you() { printf("  thank you\n"); }
	void alarm() { printf("  alarm!\n"); }
};

// 2. Define states, events and traits
enum class TurnstileState { Locked, Unlocked };
enum class TurnstileEvent { Coin, Pass };

struct TurnstileTraits {
	using Context = Turnstile;
	using State   = TurnstileState;
	using Event   = TurnstileEvent;
};

using Builder    = fsm::Builder<TurnstileTraits>;
using Definition = fsm::Definition<TurnstileTraits>;
using Proxy      = fsm::StateProxy<TurnstileTraits>;

static const char *name(TurnstileState s) { return s == TurnstileState::Locked ? "LOCKED" : "UNLOCKED"; }
static const char *name(TurnstileEvent e) { return e == TurnstileEvent::Coin ? "COIN" : "PASS"; }

// 3. Declare the machine once
static Definition turnstile_definition() {
	Builder b;
	b.with([](Builder &m) {
		m.initial([](const Turnstile &t) { return t.locked ? TurnstileState::Locked : TurnstileState::Unlocked; });
		m.default_entry([](Turnstile &, TurnstileState from, TurnstileState to) { printf("  entering %s from %s\n", name(to), name(from)); });
		m.default_exit([](Turnstile &, TurnstileState from, TurnstileState to) { printf("  exiting %s to %s\n", name(from), name(to)); });
		m.default_action([](Turnstile &t, TurnstileState, TurnstileEvent) { t.alarm(); });

		m.state(TurnstileState::Locked).with([](Proxy &s) { s.on(TurnstileEvent::Coin, TurnstileState::Unlocked, [](Turnstile &t) { t.unlock(); }); });
		m.state(TurnstileState::Unlocked)
			.on(TurnstileEvent::Coin, [](Turnstile &t) { t.thank_you(); })
			.on(TurnstileEvent::Pass, TurnstileState::Locked, [](Turnstile &t) { t.lock(); });
	});
	return b.build();
}

// 4. Wrap an instance behind the domain API
class TurnstileFsm {
public:
	explicit TurnstileFsm(Turnstile &turnstile) : fsm_(definition().create(turnstile)) {}

	void coin() { send(TurnstileEvent::Coin); }
	void pass() { send(TurnstileEvent::Pass); }

private:
	static const Definition &definition() {
		static const Definition def = turnstile_definition();
		return def;
	}

	void send(TurnstileEvent e) {
		printf("%s in %s\n", name(e), name(fsm_.current_state()));
		fsm_.send_event(e);
	}

	fsm::Instance<TurnstileTraits> fsm_;
};

int main() {
	Turnstile    turnstile;
	TurnstileFsm fsm(turnstile);

	fsm.coin();  // LOCKED -> UNLOCKED
	fsm.pass();  // UNLOCKED -> LOCKED
	fsm.pass();  // alarm
	fsm.coin();  // LOCKED -> UNLOCKED
	fsm.coin();  // thank you
	return 0;
}
