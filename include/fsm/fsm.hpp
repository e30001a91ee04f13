#ifndef FSM_FSM_HPP
#define FSM_FSM_HPP

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace fsm {

// ============================================================================
// Errors
// ============================================================================

/// Thrown by the builder when a declaration breaks the definition rules, and
/// by `Definition::create` when no initial state can be derived.
class ConfigurationError : public std::logic_error {
public:
	using std::logic_error::logic_error;
};

/// Thrown when no rule of any kind matches the current state and event.
class EventNotAllowed : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

template <typename State, typename Event>
class EventRejected : public EventNotAllowed {
public:
	EventRejected(State state, Event event) : EventNotAllowed("Event not allowed in current state"), state_(state), event_(event) {}

	State state() const { return state_; }
	Event event() const { return event_; }

private:
	State state_;
	Event event_;
};

template <typename Traits, typename... Args>
class Builder;
template <typename Traits, typename... Args>
class Definition;
template <typename Traits, typename... Args>
class Instance;
template <typename Traits, typename... Args>
class StateProxy;

// ============================================================================
// Transition Table
// ============================================================================

template <typename Traits, typename... Args>
struct Functions {
	using Context = typename Traits::Context;
	using State   = typename Traits::State;
	using Event   = typename Traits::Event;

	using Action       = std::function<void(Context &, Args...)>;
	using Guard        = std::function<bool(Context &, Args...)>;
	using ChangeAction = std::function<void(Context &, State, State, Args...)>;
	using StateAction  = std::function<void(Context &, State, Event, Args...)>;
	using InitialState = std::function<State(const Context &)>;
};

enum class Kind {
	Guarded,  // Selected when its guard holds
	Simple,   // Unguarded, at most one per (state, event)
	Default,  // Unguarded, at most one per event, any source state
};

template <typename Traits, typename... Args>
struct Transition {
	using State  = typename Traits::State;
	using Event  = typename Traits::Event;
	using Guard  = typename Functions<Traits, Args...>::Guard;
	using Action = typename Functions<Traits, Args...>::Action;

	Kind   kind       = Kind::Simple;
	Event  event      = Event{};
	bool   has_target = false;
	State  target     = State{};
	Guard  guard      = nullptr;
	Action action     = nullptr;

	bool internal() const { return !has_target; }
};

namespace detail {

template <typename Traits, typename... Args>
struct Rules {
	std::vector<Transition<Traits, Args...>> guarded;  // Declaration order
	Transition<Traits, Args...>              simple;
	bool                                     has_simple = false;
};

template <typename Traits, typename... Args>
struct Table {
	using State = typename Traits::State;
	using Event = typename Traits::Event;
	using Fn    = Functions<Traits, Args...>;

	std::map<std::pair<State, Event>, Rules<Traits, Args...>> rules;
	std::map<Event, Transition<Traits, Args...>>              default_transitions;
	std::map<State, typename Fn::ChangeAction>                entry_actions;
	std::map<State, typename Fn::ChangeAction>                exit_actions;
	std::map<State, typename Fn::StateAction>                 default_actions;
	std::set<Event>                                           events;

	typename Fn::StateAction  global_default = nullptr;
	typename Fn::ChangeAction default_entry  = nullptr;
	typename Fn::ChangeAction default_exit   = nullptr;
	typename Fn::InitialState initial        = nullptr;
};

}  // namespace detail

// ============================================================================
// Definition
// ============================================================================

template <typename Traits, typename... Args>
class Definition {
	friend class Builder<Traits, Args...>;
	friend class Instance<Traits, Args...>;

	using Table = detail::Table<Traits, Args...>;

public:
	using Context     = typename Traits::Context;
	using State       = typename Traits::State;
	using Event       = typename Traits::Event;
	using StateAction = typename Functions<Traits, Args...>::StateAction;

	/// Outcome of a resolution: exactly one of `transition` and `fallback` is set.
	/// Both point into `table`, which the match keeps alive.
	struct Match {
		const Transition<Traits, Args...> *transition = nullptr;
		const StateAction                 *fallback   = nullptr;
		std::shared_ptr<const Table>       table;
	};

	/// @brief Select the single rule that handles `event` in `state`
	/// @param ctx Context the guards are evaluated against
	/// @param state State to resolve from
	/// @param event Event to resolve
	/// @param args Call arguments handed to the guards
	/// @return The selected transition or default action; valid for as long as the match is held
	/// @throws EventRejected If no guarded, simple, default transition or default action matches
	Match resolve(Context &ctx, State state, Event event, Args... args) const {
		Match match;
		match.table = table_;

		auto it = table_->rules.find(std::make_pair(state, event));
		if (it != table_->rules.end()) {
			for (const auto &t : it->second.guarded) {
				if (t.guard(ctx, args...)) {
					match.transition = &t;
					return match;
				}
			}
			if (it->second.has_simple) {
				match.transition = &it->second.simple;
				return match;
			}
		}

		auto dt = table_->default_transitions.find(event);
		if (dt != table_->default_transitions.end()) {
			match.transition = &dt->second;
			return match;
		}

		auto da = table_->default_actions.find(state);
		if (da != table_->default_actions.end()) {
			match.fallback = &da->second;
			return match;
		}

		if (table_->global_default) {
			match.fallback = &table_->global_default;
			return match;
		}

		throw EventRejected<State, Event>(state, event);
	}

	/// @brief Events that have at least one rule from `state`; guards are not evaluated
	/// @param include_defaults Also report events covered by default transitions and default actions
	std::set<Event> allowed(State state, bool include_defaults = false) const {
		std::set<Event> result;
		for (const auto &entry : table_->rules) {
			if (entry.first.first == state) { result.insert(entry.first.second); }
		}
		if (include_defaults) {
			for (const auto &entry : table_->default_transitions) { result.insert(entry.first); }
			if (has_default_action(state)) { result.insert(table_->events.begin(), table_->events.end()); }
		}
		return result;
	}

	bool event_allowed(Event event, State state, bool include_default = false) const {
		if (table_->rules.find(std::make_pair(state, event)) != table_->rules.end()) { return true; }
		if (!include_default) { return false; }
		return table_->default_transitions.find(event) != table_->default_transitions.end() || has_default_action(state);
	}

	bool has_initial() const { return static_cast<bool>(table_->initial); }

	/// @brief Bind a context, deriving the initial state from it
	/// @throws ConfigurationError If the definition has no initial state function
	Instance<Traits, Args...> create(Context &ctx) const {
		if (!table_->initial) { throw ConfigurationError("Initial state function not defined"); }
		return Instance<Traits, Args...>(*this, ctx, table_->initial(ctx));
	}

	Instance<Traits, Args...> create(Context &ctx, State initial) const { return Instance<Traits, Args...>(*this, ctx, initial); }

private:
	std::shared_ptr<const Table> table_;

	explicit Definition(std::shared_ptr<const Table> table) : table_(std::move(table)) {}

	bool has_default_action(State state) const {
		return static_cast<bool>(table_->global_default) || table_->default_actions.find(state) != table_->default_actions.end();
	}
};

// ============================================================================
// Instance
// ============================================================================

template <typename Traits, typename... Args>
class Instance {
	friend class Definition<Traits, Args...>;

public:
	using Context = typename Traits::Context;
	using State   = typename Traits::State;
	using Event   = typename Traits::Event;

	Instance(const Instance &)            = delete;
	Instance &operator=(const Instance &) = delete;
	Instance(Instance &&)                 = default;
	Instance &operator=(Instance &&)      = default;

	Context       &context() { return *ctx_; }
	const Context &context() const { return *ctx_; }

	const Definition<Traits, Args...> &definition() const { return definition_; }

	/// @brief Get the state the instance is currently in
	State current_state() const { return state_; }

	/// @brief Dispatch an event against the current state
	/// @param event Event to dispatch
	/// @param args Call arguments forwarded to the guards and every action of this dispatch
	/// @throws EventRejected If no rule matches; the current state is left unchanged
	/// @note Exceptions from guards and actions propagate as is. A failing exit hook or transition action
	///       leaves the state unchanged; a failing entry hook leaves the state at the target.
	void send_event(Event event, Args... args) {
		const auto match = definition_.resolve(*ctx_, state_, event, args...);

		if (match.fallback) {
			(*match.fallback)(*ctx_, state_, event, args...);
			return;
		}

		const auto &t = *match.transition;
		if (t.internal()) {
			if (t.action) { t.action(*ctx_, args...); }
			return;
		}

		const State source = state_;
		const State target = t.target;
		const auto &table  = *definition_.table_;

		run_hook(table.exit_actions, source, source, target, args...);
		if (table.default_exit) { table.default_exit(*ctx_, source, target, args...); }

		if (t.action) { t.action(*ctx_, args...); }
		state_ = target;

		run_hook(table.entry_actions, target, source, target, args...);
		if (table.default_entry) { table.default_entry(*ctx_, source, target, args...); }
	}

	std::set<Event> allowed(bool include_defaults = false) const { return definition_.allowed(state_, include_defaults); }

	bool event_allowed(Event event, bool include_default = false) const { return definition_.event_allowed(event, state_, include_default); }

private:
	Definition<Traits, Args...> definition_;
	Context                    *ctx_;
	State                       state_;

	Instance(Definition<Traits, Args...> definition, Context &ctx, State initial)
		: definition_(std::move(definition)), ctx_(&ctx), state_(initial) {}

	template <typename Hooks>
	void run_hook(const Hooks &hooks, State owner, State source, State target, Args... args) {
		auto it = hooks.find(owner);
		if (it != hooks.end()) { it->second(*ctx_, source, target, args...); }
	}
};

// ============================================================================
// Synchronized Instance
// ============================================================================

/// Instance wrapper that serializes every call behind one mutex. Guards and
/// actions run with the lock held and must not call back into the wrapper.
template <typename Traits, typename... Args>
class SynchronizedInstance {
public:
	using State = typename Traits::State;
	using Event = typename Traits::Event;

	explicit SynchronizedInstance(Instance<Traits, Args...> instance) : instance_(std::move(instance)) {}

	SynchronizedInstance(const SynchronizedInstance &)            = delete;
	SynchronizedInstance &operator=(const SynchronizedInstance &) = delete;

	void send_event(Event event, Args... args) {
		std::lock_guard<std::mutex> lock(mutex_);
		instance_.send_event(event, args...);
	}

	State current_state() const {
		std::lock_guard<std::mutex> lock(mutex_);
		return instance_.current_state();
	}

	std::set<Event> allowed(bool include_defaults = false) const {
		std::lock_guard<std::mutex> lock(mutex_);
		return instance_.allowed(include_defaults);
	}

	bool event_allowed(Event event, bool include_default = false) const {
		std::lock_guard<std::mutex> lock(mutex_);
		return instance_.event_allowed(event, include_default);
	}

private:
	mutable std::mutex        mutex_;
	Instance<Traits, Args...> instance_;
};

// ============================================================================
// Builder
// ============================================================================

template <typename Traits, typename... Args>
class Builder {
	using Table = detail::Table<Traits, Args...>;
	using Fn    = Functions<Traits, Args...>;

public:
	using Context      = typename Traits::Context;
	using State        = typename Traits::State;
	using Event        = typename Traits::Event;
	using Action       = typename Fn::Action;
	using Guard        = typename Fn::Guard;
	using ChangeAction = typename Fn::ChangeAction;
	using StateAction  = typename Fn::StateAction;
	using InitialState = typename Fn::InitialState;

	/// @brief Declare an external transition from `state` to `target` on `event`
	/// @throws ConfigurationError If an unguarded transition already exists for (state, event)
	Builder &transition(State state, Event event, State target, Action action) {
		return add(state, make(Kind::Simple, event, true, target, nullptr, std::move(action)));
	}

	/// @brief Declare a guarded external transition; guards for one (state, event) are tried in declaration order
	Builder &transition(State state, Event event, State target, Guard guard, Action action) {
		return add(state, make(Kind::Guarded, event, true, target, std::move(guard), std::move(action)));
	}

	/// @brief Declare an internal transition: the action runs, the state stays and no entry/exit hook fires
	Builder &transition(State state, Event event, Action action) {
		return add(state, make(Kind::Simple, event, false, State{}, nullptr, std::move(action)));
	}

	Builder &transition(State state, Event event, Guard guard, Action action) {
		return add(state, make(Kind::Guarded, event, false, State{}, std::move(guard), std::move(action)));
	}

	/// @brief Declare the fallback transition for `event` used when no state specific rule matches
	/// @throws ConfigurationError If a default transition already exists for `event`
	Builder &default_transition(Event event, State target, Action action) {
		return add_default(make(Kind::Default, event, true, target, nullptr, std::move(action)));
	}

	Builder &default_transition(Event event, Action action) {
		return add_default(make(Kind::Default, event, false, State{}, nullptr, std::move(action)));
	}

	/// @brief Declare the last resort handler invoked when nothing else matches
	Builder &default_action(StateAction action) {
		check_mutable();
		require(action, "Default action must not be empty");
		require(!table_.global_default, "Default action already defined");
		table_.global_default = std::move(action);
		return *this;
	}

	/// @brief Declare the handler invoked in `state` when no transition matches
	Builder &default_action(State state, StateAction action) {
		check_mutable();
		require(action, "Default action must not be empty");
		return put(table_.default_actions, state, std::move(action), "Default action already defined for state");
	}

	Builder &entry(State state, ChangeAction action) {
		check_mutable();
		require(action, "Entry action must not be empty");
		return put(table_.entry_actions, state, std::move(action), "Entry action already defined for state");
	}

	Builder &exit(State state, ChangeAction action) {
		check_mutable();
		require(action, "Exit action must not be empty");
		return put(table_.exit_actions, state, std::move(action), "Exit action already defined for state");
	}

	/// @brief Declare the entry hook run after the state specific one on every external transition
	Builder &default_entry(ChangeAction action) {
		check_mutable();
		require(action, "Default entry action must not be empty");
		require(!table_.default_entry, "Default entry action already defined");
		table_.default_entry = std::move(action);
		return *this;
	}

	/// @brief Declare the exit hook run after the state specific one on every external transition
	Builder &default_exit(ChangeAction action) {
		check_mutable();
		require(action, "Default exit action must not be empty");
		require(!table_.default_exit, "Default exit action already defined");
		table_.default_exit = std::move(action);
		return *this;
	}

	/// @brief Set the function deriving an instance's initial state from its context; the last call wins
	Builder &initial(InitialState fn) {
		check_mutable();
		require(fn, "Initial state function must not be empty");
		table_.initial = std::move(fn);
		return *this;
	}

	/// @brief Open a declaration block for `state`
	/// @return A proxy bound to this builder; valid only while the builder stays alive and in place
	StateProxy<Traits, Args...> state(State state) {
		check_mutable();
		return StateProxy<Traits, Args...>(this, state);
	}

	/// @brief Run a whole-machine declaration block against this builder
	/// @tparam F Callable type with signature `void(Builder&)`
	template <class F>
	Builder &with(F &&fn) {
		static_assert(std::is_same<void, decltype(fn(std::declval<Builder &>()))>::value, "F must be callable as void(Builder&)");
		check_mutable();
		fn(*this);
		return *this;
	}

	bool completed() const { return completed_; }

	/// @brief Freeze the declarations into an immutable definition
	/// @return The definition; copies share one read-only table
	/// @throws ConfigurationError If the builder was already completed
	Definition<Traits, Args...> complete() {
		check_mutable();
		completed_ = true;
		return Definition<Traits, Args...>(std::make_shared<const Table>(table_));
	}

	Definition<Traits, Args...> build() { return complete(); }

private:
	Table table_;
	bool  completed_ = false;

	static Transition<Traits, Args...> make(Kind kind, Event event, bool has_target, State target, Guard guard, Action action) {
		Transition<Traits, Args...> t;
		// An empty guard makes the transition unguarded
		t.kind       = (kind == Kind::Guarded && !guard) ? Kind::Simple : kind;
		t.event      = event;
		t.has_target = has_target;
		t.target     = target;
		t.guard      = std::move(guard);
		t.action     = std::move(action);
		return t;
	}

	static void require(bool condition, const char *message) {
		if (!condition) { throw ConfigurationError(message); }
	}

	template <typename F>
	static void require(const F &fn, const char *message) {
		require(static_cast<bool>(fn), message);
	}

	void check_mutable() const { require(!completed_, "State machine has been completed"); }

	Builder &add(State source, Transition<Traits, Args...> t) {
		check_mutable();
		const Event event = t.event;
		auto       &rules = table_.rules[std::make_pair(source, event)];
		if (t.kind == Kind::Guarded) {
			rules.guarded.push_back(std::move(t));
		} else {
			require(!rules.has_simple, "Unguarded transition already defined");
			rules.simple     = std::move(t);
			rules.has_simple = true;
		}
		table_.events.insert(event);
		return *this;
	}

	Builder &add_default(Transition<Traits, Args...> t) {
		check_mutable();
		require(table_.default_transitions.find(t.event) == table_.default_transitions.end(), "Default transition already defined");
		const Event event = t.event;
		table_.default_transitions.emplace(event, std::move(t));
		table_.events.insert(event);
		return *this;
	}

	template <typename Map, typename Value>
	Builder &put(Map &map, State state, Value value, const char *message) {
		require(map.find(state) == map.end(), message);
		map.emplace(state, std::move(value));
		return *this;
	}
};

// ============================================================================
// State Proxy
// ============================================================================

/// Declaration block bound to one source state:
/// `builder.state(S).on(E, T, action).on_entry(...)` or `builder.state(S).with(...)`.
/// The proxy refers to its builder: it must not outlive it, nor be used after the builder is moved.
template <typename Traits, typename... Args>
class StateProxy {
	friend class Builder<Traits, Args...>;

	using BuilderType = Builder<Traits, Args...>;
	using State       = typename Traits::State;
	using Event       = typename Traits::Event;

	BuilderType *builder_;
	State        state_;

	StateProxy(BuilderType *b, State s) : builder_(b), state_(s) {}

public:
	State state() const { return state_; }

	StateProxy &on(Event event, State target, typename BuilderType::Action action) {
		builder_->transition(state_, event, target, std::move(action));
		return *this;
	}
	StateProxy &on(Event event, State target, typename BuilderType::Guard guard, typename BuilderType::Action action) {
		builder_->transition(state_, event, target, std::move(guard), std::move(action));
		return *this;
	}
	StateProxy &on(Event event, typename BuilderType::Action action) {
		builder_->transition(state_, event, std::move(action));
		return *this;
	}
	StateProxy &on(Event event, typename BuilderType::Guard guard, typename BuilderType::Action action) {
		builder_->transition(state_, event, std::move(guard), std::move(action));
		return *this;
	}
	StateProxy &on_entry(typename BuilderType::ChangeAction action) {
		builder_->entry(state_, std::move(action));
		return *this;
	}
	StateProxy &on_exit(typename BuilderType::ChangeAction action) {
		builder_->exit(state_, std::move(action));
		return *this;
	}
	StateProxy &otherwise(typename BuilderType::StateAction action) {
		builder_->default_action(state_, std::move(action));
		return *this;
	}

	template <class F>
	StateProxy &with(F &&fn) {
		static_assert(std::is_same<void, decltype(fn(std::declval<StateProxy &>()))>::value, "F must be callable as void(StateProxy&)");
		fn(*this);
		return *this;
	}
};

}  // namespace fsm

#endif  // FSM_FSM_HPP
