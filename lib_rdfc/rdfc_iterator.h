#ifndef RDFC_ITERATOR_H
#define RDFC_ITERATOR_H


#include "rdfc_types.h"


namespace rdfc
{


/*
* This is an interface to an object which iterates over values
* of a generic type T.
* These iterators are initialised to be invalid.
* You can call `current` and `next` if and only if the iterator is `valid`.
* `start` can be called at any time to validate the iterator and restart it.
* Calling `next` will result in invalidating the iterator once the end is reached.
*/
template<typename T>
class IIterator
{
public:
	virtual ~IIterator() = default;

	virtual void start() = 0;  // post: points to first element, if any
	virtual T current() const = 0;  // pre: `valid()`
	virtual void next() = 0;  // pre: `valid()`
	virtual bool valid() const = 0;
};


typedef IIterator<Quad> IQuadIterator;


}  // namespace rdfc


#endif  // RDFC_ITERATOR_H
