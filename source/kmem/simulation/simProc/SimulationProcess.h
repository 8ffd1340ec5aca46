/*  This file is part of KMem, a cycle-accurate model of a key memory core.
	Copyright (C) 2026 The KMem Authors

	KMem is free software; you can redistribute it and/or
	modify it under the terms of the GNU Lesser General Public
	License as published by the Free Software Foundation; either
	version 3 of the License, or (at your option) any later version.

	KMem is distributed in the hope that it will be useful,
	but WITHOUT ANY WARRANTY; without even the implied warranty of
	MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
	Lesser General Public License for more details.

	You should have received a copy of the GNU Lesser General Public
	License along with this library; if not, write to the Free Software
	Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301  USA
*/
#pragma once

#include <coroutine>
#include "../../utils/Exceptions.h"
#include "../../utils/Preprocessor.h"

#include <concepts>
#include <cstdlib>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <queue>
#include <type_traits>
#include <utility>
#include <vector>

namespace kmem::sim {

namespace internal {

/**
 * @brief Reference counting part of all simulation coroutine promises.
 */
class PromiseBase
{
	public:
		void registerHandle() { m_numHandles++; }
		void deregisterHandle() { KMEM_ASSERT(m_numHandles > 0); m_numHandles--; }
		size_t numReferences() const { return m_numHandles; }

		/// Coroutines suspended until this one finishes.
		std::vector<std::coroutine_handle<>> awaitingFinalSuspend;
	protected:
		size_t m_numHandles = 0;
};

/**
 * @brief Type erased, reference counted coroutine handle that destroys the coroutine when the last reference goes away.
 */
class CoroutineRef
{
	public:
		CoroutineRef() = default;

		template<std::derived_from<PromiseBase> PromiseType>
		CoroutineRef(std::coroutine_handle<PromiseType> handle) : m_handle(handle), m_promise(handle ? &handle.promise() : nullptr) {
			if (m_promise)
				m_promise->registerHandle();
		}

		CoroutineRef(const CoroutineRef &other) : m_handle(other.m_handle), m_promise(other.m_promise) {
			if (m_promise)
				m_promise->registerHandle();
		}

		CoroutineRef(CoroutineRef &&other) noexcept :
			m_handle(std::exchange(other.m_handle, {})), m_promise(std::exchange(other.m_promise, nullptr)) { }

		CoroutineRef &operator=(CoroutineRef other) {
			std::swap(m_handle, other.m_handle);
			std::swap(m_promise, other.m_promise);
			return *this;
		}

		~CoroutineRef() { reset(); }

		void reset() {
			if (m_promise) {
				m_promise->deregisterHandle();
				if (m_promise->numReferences() == 0) // last reference, destroy coroutine and promise
					m_handle.destroy();
				m_handle = {};
				m_promise = nullptr;
			}
		}

		explicit operator bool() const { return (bool) m_handle; }

		void resume() const {
			if (m_handle)
				m_handle.resume();
		}

		bool done() const {
			if (!m_handle)
				return true;
			return m_handle.done();
		}

		PromiseBase &promise() const { return *m_promise; }
		std::coroutine_handle<> rawHandle() const { return m_handle; }
	protected:
		std::coroutine_handle<> m_handle = {};
		PromiseBase *m_promise = nullptr;
};

template<typename ReturnValue>
struct ReturnValueStorage {
	std::optional<ReturnValue> returnValue;
	template<std::convertible_to<ReturnValue> From>
	void return_value(From &&from) { returnValue.emplace(std::forward<From>(from)); }
};

template<>
struct ReturnValueStorage<void> {
	void return_void() { }
};

}

/**
 * @brief Return type of all simulation coroutines, e.g. `SimulationFunction<std::uint32_t> read(std::uint8_t address)`.
 * @details A simulation function does not run on creation. It is either started as a simulation process by the simulator,
 * forked with forkFunc, or called from another simulation function with co_await, in which case the caller is suspended
 * until the callee finished and receives its return value.
 */
template<typename ReturnValue = void>
class SimulationFunction {
	public:
		struct promise_type : public internal::PromiseBase, public internal::ReturnValueStorage<ReturnValue> {

			using returnType = ReturnValue;

			promise_type() = default;
			promise_type(const promise_type &) = delete;
			void operator=(const promise_type &) = delete;

			SimulationFunction<ReturnValue> get_return_object() { return SimulationFunction<ReturnValue>(std::coroutine_handle<promise_type>::from_promise(*this)); }
			std::suspend_always initial_suspend() noexcept { return {}; }
			void unhandled_exception() { throw; }

			/**
			 * @brief Special awaiter for the final suspend that potentially resumes the calling simulation processes.
			 * @details Resume doesn't happen directly, but by adding the awaiting coroutines to the queue of ready coroutines of the SimulationCoroutineHandler.
			 */
			struct FinalSuspendAwaiter {
				bool await_ready() noexcept { return false; }
				void await_suspend(std::coroutine_handle<promise_type> handle) noexcept;
				void await_resume() noexcept {}
			};
			FinalSuspendAwaiter final_suspend() noexcept { return FinalSuspendAwaiter{}; }

			/// Keeps a lambda (and its captures) alive for as long as the coroutine it spawned exists.
			std::unique_ptr<std::function<SimulationFunction<ReturnValue>()>> functorInstance;
		};

		SimulationFunction() = default;
		explicit SimulationFunction(std::coroutine_handle<promise_type> handle) : m_typedHandle(handle), m_handle(handle) { }

		const internal::CoroutineRef &getHandle() const { return m_handle; }
		promise_type &promise() const { return m_typedHandle.promise(); }
		bool done() const { return m_handle.done(); }

		/**
		 * @brief Awaiter for suspending a coroutine until another finishes.
		 * @details Unless the coroutine to be joined has already finished, adds the calling coroutine to the list of coroutines awaiting its final suspend.
		 */
		struct Join {
			internal::CoroutineRef calledSimulationCoroutine;
			std::coroutine_handle<promise_type> typedHandle;

			bool await_ready() noexcept { return calledSimulationCoroutine.done(); }
			void await_suspend(std::coroutine_handle<> callingSimulationCoroutine) noexcept {
				calledSimulationCoroutine.promise().awaitingFinalSuspend.push_back(callingSimulationCoroutine);
			}
			ReturnValue await_resume() {
				if constexpr (!std::is_void_v<ReturnValue>)
					return *typedHandle.promise().returnValue;
			}
		};

		/// Produces an awaiter if this SimulationFunction is co_awaited as a called sub-process of another SimulationFunction.
		Join operator co_await() {
			m_handle.resume();
			return Join{ m_handle, m_typedHandle };
		}

		/// Awaiter that waits for an already running (forked) simulation function without resuming it.
		Join join() const { return Join{ m_handle, m_typedHandle }; }
	protected:
		std::coroutine_handle<promise_type> m_typedHandle = {};
		internal::CoroutineRef m_handle;
};

/**
 * @brief Owns the simulation processes and resumes coroutines that became ready.
 */
class SimulationCoroutineHandler {
	public:
		static thread_local SimulationCoroutineHandler *activeHandler;

		~SimulationCoroutineHandler();

		template<typename ReturnValue>
		void start(const SimulationFunction<ReturnValue> &handle, bool runImmediate = false) {
			KMEM_ASSERT(!handle.getHandle().done());
			m_simulationCoroutines.emplace(handle.getHandle().rawHandle().address(), handle.getHandle());
			if (runImmediate)
				handle.getHandle().resume();
			else
				readyToResume(handle.getHandle().rawHandle());
		}
		/// Destroys all simulation processes and drops everything that was about to be resumed.
		void stopAll();

		void readyToResume(std::coroutine_handle<> handle) { m_coroutinesReadyToResume.push(handle); }
		/// Resumes coroutines until none is ready anymore.
		void run();

		void coroutineFinalSuspending(std::coroutine_handle<> handle);

		size_t numRunningProcesses() const { return m_simulationCoroutines.size(); }
	protected:
		std::map<void*, internal::CoroutineRef> m_simulationCoroutines;
		std::queue<std::coroutine_handle<>> m_coroutinesReadyToResume;
};


template<typename ReturnValue>
void SimulationFunction<ReturnValue>::promise_type::FinalSuspendAwaiter::await_suspend(std::coroutine_handle<promise_type> handle) noexcept {
	auto *handler = SimulationCoroutineHandler::activeHandler;
	for (const auto &coro : handle.promise().awaitingFinalSuspend)
		handler->readyToResume(coro);
	handler->coroutineFinalSuspending(handle);
}


/// Starts a simulation function as an independent simulation process that runs until its first suspension immediately.
template<typename ReturnValue>
SimulationFunction<ReturnValue> forkFunc(const SimulationFunction<ReturnValue> &simFunc)
{
	auto *handler = SimulationCoroutineHandler::activeHandler;
	KMEM_DESIGNCHECK_HINT(handler != nullptr, "Forking is only possible from within a running simulation process.");
	handler->start(simFunc, true);
	return simFunc;
}


template<typename ReturnValue>
SimulationFunction<ReturnValue> forkFunc(std::function<SimulationFunction<ReturnValue>()> &&functor)
{
	// Create a "portable" copy of the functor before we invoke.
	auto functorInstance = std::make_unique<std::function<SimulationFunction<ReturnValue>()>>(std::move(functor));
	// Invoke the copy so that all internal references are wrt. to said copy.
	auto simFunc = (*functorInstance)();
	// Store the copy in the promise object to be kept alive as long as the promise/coroutine exists.
	simFunc.promise().functorInstance = std::move(functorInstance);

	return forkFunc(simFunc);
}


extern template class SimulationFunction<void>;
extern template class SimulationFunction<bool>;
extern template class SimulationFunction<size_t>;
extern template class SimulationFunction<std::uint32_t>;

}
