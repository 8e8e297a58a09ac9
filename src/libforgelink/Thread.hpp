#ifndef forgelink_Thread_hpp_
#define forgelink_Thread_hpp_

#include <utility>
#include <string>
#include <boost/thread.hpp>

namespace ForgeLink {

// Set thread name.
// Returns false if the API is not supported.
//
// pthread_setname_np supports maximum 15 character thread names! (16th character is the null terminator)
//
// Naming another thread is not supported by OSX.
bool set_thread_name(boost::thread &thread, const char *thread_name);
inline bool set_thread_name(boost::thread &thread, const std::string &thread_name) { return set_thread_name(thread, thread_name.c_str()); }

template<class Fn>
inline boost::thread create_thread(boost::thread::attributes &attrs, Fn &&fn)
{
    // The workers only block on sockets, a small stack is plenty.
    attrs.set_stack_size(512 * 1024);
    return boost::thread{attrs, std::forward<Fn>(fn)};
}

template<class Fn> inline boost::thread create_thread(Fn &&fn)
{
    boost::thread::attributes attrs;
    return create_thread(attrs, std::forward<Fn>(fn));
}

}

#endif // forgelink_Thread_hpp_
