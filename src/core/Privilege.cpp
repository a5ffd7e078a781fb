#include "Privilege.h"
#include "Logging.h"
#ifdef PLUG_SCAN_HAVE_LIBCAP
#include <sys/capability.h>
#endif

namespace plug_scan {

void log_capabilities(const std::string& context) {
#ifdef PLUG_SCAN_HAVE_LIBCAP
    cap_t caps = cap_get_proc();
    if (!caps) {
        Logger::instance().warn("Failed to get current capabilities for " + context);
        return;
    }
    char* cap_text = cap_to_text(caps, nullptr);
    if (cap_text) {
        Logger::instance().info("Capabilities " + context + ": " + std::string(cap_text));
        cap_free(cap_text);
    } else {
        Logger::instance().warn("Failed to convert capabilities to text for " + context);
    }
    cap_free(caps);
#else
    Logger::instance().info("Capabilities logging not available (libcap not compiled in)");
#endif
}

bool drop_capabilities(){
#ifdef PLUG_SCAN_HAVE_LIBCAP
    Logger::instance().info("Dropping capabilities");
    log_capabilities("before drop");
    cap_t caps = cap_get_proc();
    if(!caps){
        Logger::instance().error("cap_get_proc failed");
        return false;
    }
    cap_clear(caps);
    bool ok = cap_set_proc(caps) == 0;
    cap_free(caps);
    if(!ok){
        Logger::instance().error("cap_set_proc failed");
        return false;
    }
    log_capabilities("after drop");
    return true;
#else
    Logger::instance().info("Capability dropping not available (libcap not compiled in)");
    return true;
#endif
}

bool is_privilege_available(){
#ifdef PLUG_SCAN_HAVE_LIBCAP
    return true;
#else
    return false;
#endif
}

}
