#include "Device.h"

namespace plug_scan {

const char* power_state_name(PowerState s){
    switch(s){
        case PowerState::On: return "on";
        case PowerState::Off: return "off";
        case PowerState::Unknown: return "unknown";
    }
    return "unknown";
}

const char* connectivity_name(Connectivity c){
    switch(c){
        case Connectivity::Online: return "online";
        case Connectivity::Offline: return "offline";
        case Connectivity::Unknown: return "unknown";
    }
    return "unknown";
}

const std::vector<std::string>& supported_commands(){
    static const std::vector<std::string> cmds = {"on", "off", "toggle", "get_state"};
    return cmds;
}

}
