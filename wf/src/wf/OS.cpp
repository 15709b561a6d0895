#include "wf/OS.h"

#include <stdlib.h>

namespace wf
{
	void
	_panic(const char* cause)
	{
		printerr("[panic]: {}\n", cause);
		::abort();
	}
}
