#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <stdexcept>
#include <utility>

namespace wordgame {

//! Thrown by SafeQueue::Pop once the queue is released and drained.
class QueueReleased : public std::runtime_error {
public:
	QueueReleased() : std::runtime_error("Queue released") {
	}
};

//! Thread safe FIFO queue with a blocking Pop function.
template <class Entry>
class SafeQueue {
public:
	SafeQueue();

	//! Push element onto the queue.
	void Push(Entry value);

	//! Thread blocks here until there is an element to receive.
	//! \note Throws QueueReleased when the queue is empty and blocking is disabled.
	Entry Pop();

	bool Empty() const;
	std::size_t Size() const;

	//! Stop blocking the threads trying to pop an element from the queue.
	//! Entries still queued are handed out before Pop starts throwing.
	void Release();

	bool Released() const; //!< True once Release was called.

protected:
	std::deque<Entry> m_queue;           //!< Stores the entries.
	mutable std::mutex m_mutex;          //!< Manage access to the queue.
	std::condition_variable m_condition; //!< Notify that element can be popped.
	std::atomic<bool> m_blockThreads;    //!< Should the Pop function block the threads or not.
};


template <class Entry>
SafeQueue<Entry>::SafeQueue() : m_blockThreads(true) {
}

template <class Entry>
void SafeQueue<Entry>::Push(Entry value) {
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		m_queue.push_back(std::move(value));
	}
	m_condition.notify_one();
}

template <class Entry>
Entry SafeQueue<Entry>::Pop() {
	std::unique_lock<std::mutex> lock(m_mutex);
	m_condition.wait(lock, [this] { return !(m_queue.empty() && m_blockThreads); });

	if (m_queue.empty()) {
		throw QueueReleased();
	}

	Entry element = std::move(m_queue.front());
	m_queue.pop_front();
	return element;
}

template <class Entry>
bool SafeQueue<Entry>::Empty() const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_queue.empty();
}

template <class Entry>
std::size_t SafeQueue<Entry>::Size() const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_queue.size();
}

template <class Entry>
void SafeQueue<Entry>::Release() {
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		m_blockThreads.store(false);
	}
	m_condition.notify_all();
}

template <class Entry>
bool SafeQueue<Entry>::Released() const {
	return !m_blockThreads.load();
}

} // namespace wordgame
