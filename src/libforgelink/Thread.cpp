#include <pthread.h>

#include "Thread.hpp"

namespace ForgeLink {

#ifdef __APPLE__

bool set_thread_name(boost::thread &thread, const char *thread_name)
{
	// pthread_setname_np() only names the calling thread on OSX.
	return false;
}

#else

// posix
bool set_thread_name(boost::thread &thread, const char *thread_name)
{
   	return pthread_setname_np(thread.native_handle(), thread_name) == 0;
}

#endif // __APPLE__

} // namespace ForgeLink
