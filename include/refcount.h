#if !defined(REFCOUNT_H)
#define REFCOUNT_H
/*
 * Reference counting with delete on last release.
 *
 * A compiled regular expression is shared by every copy of the pattern that
 * refers to it, possibly from several threads at once, so the count is atomic.
 *
 * (c) Copyright Clifford Heath 2022. See LICENSE file for usage rights.
 */
#include	<atomic>

class	RefCounted
{
public:
	virtual		~RefCounted() { }
			RefCounted() : ref_count(0) {}
			RefCounted(const RefCounted&) : ref_count(0) {}	// A copy is a new object
	void		AddRef() { (void)ref_count++; }
	void		Release() { if (--ref_count == 0) delete this; }
			// Only for debugging, may be instantly stale unless == 1:
	int		GetRefCount() const { return (int)ref_count; }

private:
	RefCounted&	operator=(const RefCounted&);	// Not assignable

	std::atomic<int>	ref_count;
};

template <class T>
class Ref
{
	std::atomic<T*>	ptr;

public:
			~Ref() { T* o = ptr; if (o) o->Release(); }
			Ref() : ptr(0) {}
			Ref(T* o) : ptr(o) { if (o) o->AddRef(); }
			Ref(const Ref& other) : ptr(0) { T* o = other; if (o) o->AddRef(); ptr = o; }
	Ref&		operator=(const Ref& other)
			{
				return *this = (T*)other;
			}
	Ref&		operator=(T* other)
			{
				if (other)
					other->AddRef();

				T*      o = ptr.exchange(other);
				if (o)
					o->Release();
				return *this;
			}

			operator T*() const { return ptr; }
	T*		operator->() const { return ptr; }
	T&		operator*() const { return *ptr; }

	bool		operator==(const Ref& other) const { return (T*)ptr == (T*)other; }
	bool		operator!=(const Ref& other) const { return (T*)ptr != (T*)other; }
};

#endif
