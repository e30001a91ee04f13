#include <cstdio>
#include <fsm/fsm.hpp>
#include <string>

struct Account {
	long balance = 0;
	long limit   = 100;
};

enum class AccountState { Open, Overdrawn, Closed };
enum class AccountEvent { Deposit, Withdraw, Close, Audit };

struct AccountTraits {
	using Context = Account;
	using State   = AccountState;
	using Event   = AccountEvent;
};

// Every action receives the amount and a memo
using Builder = fsm::Builder<AccountTraits, long, const std::string &>;

int main() {
	Builder b;

	// Guards are tried in declaration order: most specific first
	b.transition(
		AccountState::Open, AccountEvent::Withdraw, AccountState::Overdrawn,
		[](Account &a, long amount, const std::string &) { return amount > a.balance && amount - a.balance <= a.limit; },
		[](Account &a, long amount, const std::string &memo) {
			a.balance -= amount;
			printf("withdraw %ld (%s), overdrawn: %ld\n", amount, memo.c_str(), a.balance);
		});
	b.transition(
		AccountState::Open, AccountEvent::Withdraw, [](Account &a, long amount, const std::string &) { return amount <= a.balance; },
		[](Account &a, long amount, const std::string &memo) {
			a.balance -= amount;
			printf("withdraw %ld (%s), balance: %ld\n", amount, memo.c_str(), a.balance);
		});
	b.transition(AccountState::Open, AccountEvent::Deposit, [](Account &a, long amount, const std::string &) { a.balance += amount; });
	b.transition(
		AccountState::Overdrawn, AccountEvent::Deposit, AccountState::Open, [](Account &a, long amount, const std::string &) { return a.balance + amount >= 0; },
		[](Account &a, long amount, const std::string &) { a.balance += amount; });
	b.transition(AccountState::Overdrawn, AccountEvent::Deposit, [](Account &a, long amount, const std::string &) { a.balance += amount; });

	// Close works from anywhere
	b.default_transition(AccountEvent::Close, AccountState::Closed, [](Account &, long, const std::string &memo) { printf("closing: %s\n", memo.c_str()); });
	b.default_action(AccountState::Closed,
	                 [](Account &, AccountState, AccountEvent, long, const std::string &) { printf("account closed, ignoring\n"); });
	b.entry(AccountState::Overdrawn, [](Account &a, AccountState, AccountState, long, const std::string &) { printf("now overdrawn by %ld\n", -a.balance); });

	auto def = b.complete();

	Account account;
	auto    machine = def.create(account, AccountState::Open);

	machine.send_event(AccountEvent::Deposit, 50, "salary");
	machine.send_event(AccountEvent::Withdraw, 30, "groceries");
	machine.send_event(AccountEvent::Withdraw, 60, "rent");

	try {
		machine.send_event(AccountEvent::Withdraw, 10, "coffee");
	} catch (const fsm::EventNotAllowed &e) {
		printf("rejected: %s\n", e.what());
	}

	machine.send_event(AccountEvent::Deposit, 100, "refund");
	printf("audit allowed: %s\n", machine.event_allowed(AccountEvent::Audit, true) ? "yes" : "no");
	machine.send_event(AccountEvent::Close, 0, "customer request");
	machine.send_event(AccountEvent::Audit, 0, "year end");
	return 0;
}
