#pragma once

#include <stdint.h>
#include <stddef.h>

#include <Textmode/common.hpp>

#include <type_traits>
#include <utility>

namespace format
{
	template<typename OutputIt>
	struct format_output_it {
		format_output_it(OutputIt& it): it{it} {}

		void write(const char* str){
			while(*str)
				it.putc(*str++);
		}

		void write(const char c){
			it.putc(c);
		}

		void flush() {
			it.flush();
		}

		private:
		OutputIt& it;
	};

	struct format_args {
		char sign = '-';
		bool alternate = false;
		char type = ' ';
	};

	namespace internal {
		template<typename OutputIt, typename T>
		void format_integer(format_output_it<OutputIt>& out, format_args args, T v){
			if(args.type == ' ')
				args.type = 'd';

			int base = 10;
			bool capital = false;
			const char* base_prefix = "";
			
			switch (args.type)
			{
			// Type options
			case 'b': // Binary
				base = 2;
				base_prefix = "0b";
				break;
			case 'B':
				base = 2;
				base_prefix = "0B";
				break;
			case 'o': // Octal
				base = 8;
				base_prefix = "0";
				break;
			case 'p':
			case 'x': // Hex, lowercase
				base = 16;
				base_prefix = "0x";
				break;
			case 'X': // Hex, uppercase
				base = 16;
				base_prefix = "0X";
				capital = true;
				break;
			default: // Decimal
				break;
			}

			bool negative = false;
			// Other bases print the two's complement at the width of T
			uint64_t value = (uint64_t)(std::make_unsigned_t<T>)v;
			if constexpr(std::is_signed_v<T>) {
				if(v < 0 && base == 10) {
					negative = true;
					value = (uint64_t)0 - (uint64_t)(int64_t)v;
				}
			}

			// Enough for a 64-bit binary number
			char int_buf[65];
			char* ptr = int_buf + sizeof(int_buf);
			*--ptr = '\0';

			const char* digits = capital ? "0123456789ABCDEF" : "0123456789abcdef";
			do {
				*--ptr = digits[value % base];
				value /= base;
			} while(value);

			if(negative)
				out.write('-');
			else if(base == 10 && args.sign != '-')
				out.write(args.sign); // '+' or ' '

			if(args.alternate)
				out.write(base_prefix);

			out.write(ptr);
		}
	}

	template<typename T>
	struct formatter;

	template<>
	struct formatter<const char*> {
		template<typename OutputIt>
		static void format(format_output_it<OutputIt>& it, [[maybe_unused]] format_args args, const char* item){
			it.write(item ? item : "(null)");
		}
	};

	template<>
	struct formatter<char*> {
		template<typename OutputIt>
		static void format(format_output_it<OutputIt>& it, format_args args, char* item){
			formatter<const char*>::format(it, args, item);
		}
	};

	#define INT_IMPL(T) \
		template<> \
		struct formatter<T> { \
			template<typename OutputIt> \
			static void format(format_output_it<OutputIt>& it, format_args args, T item){ \
				internal::format_integer(it, args, item); \
			} \
		};

	INT_IMPL(signed char)
	INT_IMPL(unsigned char)

	INT_IMPL(short int)
	INT_IMPL(unsigned short int)

	INT_IMPL(int)
	INT_IMPL(unsigned int)

	INT_IMPL(long int)
	INT_IMPL(unsigned long int)

	INT_IMPL(long long int)
	INT_IMPL(unsigned long long int)

	#undef INT_IMPL

	template<>
	struct formatter<char> {
		template<typename OutputIt>
		static void format(format_output_it<OutputIt>& it, format_args args, char item){
			if(args.type == ' ')
				args.type = 'c';

			if(args.type == 'c')
				it.write(item);
			else
				formatter<unsigned char>::format(it, args, (unsigned char)item);
		}
	};

	template<>
	struct formatter<bool> {
		template<typename OutputIt>
		static void format(format_output_it<OutputIt>& it, format_args args, bool item){
			if(args.type == ' ')
				args.type = 's'; // Textual is default

			switch (args.type)
			{
			case 'd':
				it.write(item ? "1" : "0");
				break;
			default:
				it.write(item ? "true" : "false");
				break;
			}
		}
	};

	template<>
	struct formatter<void*> {
		template<typename OutputIt>
		static void format(format_output_it<OutputIt>& it, [[maybe_unused]] format_args args, void* item){
			formatter<uintptr_t>::format(it, {.alternate = true, .type = 'x'}, (uintptr_t)item); // Default is 0xYYYYYYYYYYYYYYYY where Y is the pointer
		}
	};

	template<>
	struct formatter<const void*> {
		template<typename OutputIt>
		static void format(format_output_it<OutputIt>& it, format_args args, const void* item){
			formatter<void*>::format(it, args, const_cast<void*>(item));
		}
	};

	template<typename OutputIt, typename T>
	concept Printable = requires(format_output_it<OutputIt>& it, T t, format_args args) {
		{ formatter<T>::format(it, args, t) };
	};

	namespace internal {
		template<typename OutputIt, typename... Args>
		void format_int(format_output_it<OutputIt>& out, const char* fmt, Args&&... args);

		template<typename OutputIt, typename T, typename... Args> requires Printable<OutputIt, T>
		void format_part(format_output_it<OutputIt>& out, format_args f_args, const char* fmt, T v, Args&&... args) {
			formatter<T>::format(out, f_args, v);
			format_int(out, fmt, std::forward<Args>(args)...);
		}

		template<typename OutputIt, typename... Args>
		void format_int(format_output_it<OutputIt>& out, const char* fmt, Args&&... args){
			while(*fmt){
				if(fmt[0] == '{' && fmt[1] == '{'){
					out.write('{');
					fmt += 2;
				} else if(fmt[0] == '}' && fmt[1] == '}') {
					out.write('}');
					fmt += 2;
				} else if(*fmt == '{'){
					if constexpr(sizeof...(Args) == 0) {
						// No arguments left, the field is printed as is
						out.write(*fmt);
						fmt++;
					} else {
						fmt++;

						format_args options{};
						while(*fmt != '}'){
							if(*fmt == '\0')
								PANIC("format: Unterminated replacement field");

							if(*fmt == 'b' || *fmt == 'B' || *fmt == 'c' || *fmt == 'd' || *fmt == 'o' || \
							   *fmt == 'p' || *fmt == 's' || *fmt == 'x' || *fmt == 'X') // Type
								options.type = *fmt;
							else if(*fmt == '+' || *fmt == '-' || *fmt == ' ') // Sign
								options.sign = *fmt;
							else if(*fmt == '#')
								options.alternate = true;

							fmt++;
						}

						fmt++; // Skip final '}'

						format_part(out, options, fmt, std::forward<Args>(args)...);
						return;
					}
				} else {
					out.write(*fmt);
					fmt++;
				}
			}
		}
	} // namespace internal

	template<typename OutputIt, typename... Args>
	void format_to(OutputIt& out, const char* fmt, Args&&... args){
		format_output_it<OutputIt> it{out};
		internal::format_int(it, fmt, std::forward<Args>(args)...);
		it.flush();
	}
} // namespace format
