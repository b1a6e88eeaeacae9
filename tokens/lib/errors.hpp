#pragma once

#include <exception>
#include <string>
#include <system_error>
#include <type_traits>

namespace tokens
{
/** Errors not tied to the ledger or to configuration parsing */
enum class error_common
{
	generic = 1,
	exception // Caught exception, the message is the exception's what ()
};

/** Ledger operation errors, one per failing tokens::token_status */
enum class error_token
{
	generic = 1,
	self_transfer, // Source and destination accounts are identical
	zero_amount, // Requested amount is zero
	insufficient_balance, // Source account balance is below the requested amount
	balance_overflow, // Destination balance would exceed the amount range
	self_approval, // Owner and spender are identical
	insufficient_allowance // Remaining allowance is below the requested amount
};

/** config-*.toml deserialization related errors */
enum class error_config
{
	generic = 1,
	invalid_value,
	missing_value
};
} // tokens namespace

// Convenience macro to implement the standard boilerplate for using std::error_code with enums
// Use this at the end of any header defining one or more error code enums.
#define REGISTER_ERROR_CODES(namespace_name, enum_type)                                                        \
	namespace namespace_name                                                                                   \
	{                                                                                                          \
		static_assert (static_cast<int> (enum_type::generic) > 0, "The first error enum must be generic = 1"); \
		class enum_type##_messages : public std::error_category                                                \
		{                                                                                                      \
		public:                                                                                                \
			char const * name () const noexcept override                                                       \
			{                                                                                                  \
				return #enum_type;                                                                             \
			}                                                                                                  \
                                                                                                               \
			std::string message (int ev) const override;                                                       \
		};                                                                                                     \
                                                                                                               \
		inline std::error_category const & enum_type##_category ()                                             \
		{                                                                                                      \
			static enum_type##_messages instance;                                                              \
			return instance;                                                                                   \
		}                                                                                                      \
                                                                                                               \
		inline std::error_code make_error_code (::namespace_name::enum_type err)                               \
		{                                                                                                      \
			return { static_cast<int> (err), enum_type##_category () };                                        \
		}                                                                                                      \
	}                                                                                                          \
	namespace std                                                                                              \
	{                                                                                                          \
		template <>                                                                                            \
		struct is_error_code_enum<::namespace_name::enum_type> : std::true_type                                \
		{                                                                                                      \
		};                                                                                                     \
	}

REGISTER_ERROR_CODES (tokens, error_common);
REGISTER_ERROR_CODES (tokens, error_token);
REGISTER_ERROR_CODES (tokens, error_config);

namespace tokens
{
/**
 * An error code with an optional message overriding the code's own.
 * Configuration readers accumulate their first failure in one of these.
 */
class error
{
public:
	error () = default;
	error (std::error_code);
	error (std::exception const &);
	error & operator= (std::error_code);
	error & operator= (std::exception const &);

	/** True if there's an error */
	explicit operator bool () const;
	explicit operator std::error_code () const;
	/** The custom message if one was set, otherwise the message of the error code. Empty if there's no error */
	std::string get_message () const;
	error & set (std::string message, std::error_code = tokens::error_common::generic);
	/** Sets the message, using tokens::error_common::generic as the code if none is set yet */
	error & set_message (std::string message);
	error & clear ();

private:
	std::error_code code;
	std::string message;
};
}
