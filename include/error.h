#if !defined(ERROR_HXX)
#define	ERROR_HXX
/*
 * Error numbering system.
 *
 * Each subsystem is statically allocated a 16-bit subsystem "set" number.
 * Each set contains up to 16384 messages indicated by a 14-bit code.
 * The set number 0 corresponds to the system errno, and the msg codes are the errno codes.
 *
 * For compliance with the Microsoft error scheme, the high-order (sign) bit is always set.
 * Because Microsoft subsystems also avoid using the second-top bit (they call it CUST),
 * this bit is always set, to keep clear of collisions with Microsoft subsystems.
 *
 * A returned Error carries the ErrNum, the default (English) message text, and the
 * location in the source text at which the problem was detected.
 *
 * (c) Copyright Clifford Heath 2023. See LICENSE file for usage rights.
 */
#include	<stdint.h>
#include	<limits.h>
#include	<errno.h>

#include	<refcount.h>

class ErrNum
{
public:
	static const uint32_t	ERR_FLAG = 0x80000000;	// Sign bit is used to indicate an error, allowing quick checks
	static const uint32_t	ERR_CUST = 0x40000000;	// Including this bit guarantees no collision with Microsoft subsystem codes

	constexpr ErrNum()
			: errnum(0) {}
	constexpr ErrNum(int set, int msg)
			: errnum((int32_t)(ERR_FLAG | ERR_CUST | ((uint32_t)(set & 0xFFFF) << 14) | (uint32_t)(msg & 0x3FFF))) {}
	constexpr int	set() const
			{ return (errnum >> 14) & 0xFFFF; }
	constexpr int	msg() const
			{ return errnum & 0x3FFF; }
	bool		operator==(ErrNum x) const
			{ return errnum == x.errnum; }
	bool		operator!=(ErrNum x) const
			{ return errnum != x.errnum; }
	constexpr operator int32_t() const		// Allows use in switch statements
			{ return errnum; }
private:
	int32_t		errnum;
};

/*
 * A returned error has an ErrNum, the default text, and the offset of the problem.
 * The body is shared by reference, so Errors are cheap to copy and return.
 * A default-constructed Error means no error.
 */
class	Error
{
	class Body;
public:
	Error()
			: body(0) {}
	Error(ErrNum num, const char* d = 0, int offset = -1)
			: body(new Body(num, d, offset)) {}
	Error(const Error& e)
			: body(e.body) {}
	Error&		operator=(const Error& e)
			{ body = e.body;  return *this; }
	ErrNum		error_num() const
			{ return body ? body->error_num() : ErrNum(); }
	const char*	default_text() const
			{ return body ? body->default_text() : 0; }
	int		offset() const		// -1 when the error has no location
			{ return body ? body->offset() : -1; }
	operator int32_t() const { return body ? (int32_t)body->error_num() : 0; }

private:
	Ref<Body>	body;

	class Body
	: public RefCounted
	{
	public:
		Body(ErrNum n, const char* d, int o)
		: num(n), def_text(d), location(o)
		{}
		ErrNum		error_num() const { return num; }
		const char*	default_text() const { return def_text; }
		int		offset() const { return location; }

	protected:
		ErrNum		num;
		const char*	def_text;
		int		location;
	};
};

#endif
