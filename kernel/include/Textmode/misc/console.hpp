#pragma once

#include <Textmode/common.hpp>
#include <Textmode/cpu/mutex.hpp>
#include <Textmode/lib/mutex.hpp>
#include <Textmode/misc/format.hpp>

namespace console
{
	struct Logger {
		virtual ~Logger() {}

		virtual void putc(const char c) = 0;
		virtual void flush() {}
	};

	// Interrupt handlers may print, so the kernel has to mask them while the
	// lock is held. The hosted build runs in user mode where cli faults.
#ifdef TEXTMODE_KERNEL
	using Lock = IrqTicketLock;
#else
	using Lock = TicketLock;
#endif

	// Guards the global logger, not reentrant
	extern Lock global_lock;

	// Constructs the logger on first use, caller must hold global_lock
	Logger& get_logger();
} // namespace console


template<typename... Args>
void print(const char* fmt, Args&&... args){
	lib::lock_guard guard{console::global_lock};

	format::format_to(console::get_logger(), fmt, std::forward<Args>(args)...);
}

template<typename... Args>
void println(const char* fmt, Args&&... args){
	lib::lock_guard guard{console::global_lock};

	auto& logger = console::get_logger();
	format::format_to(logger, fmt, std::forward<Args>(args)...);
	logger.putc('\n');
	logger.flush();
}

inline void println(){
	print("\n");
}
