#include "UpnpDeviceControl.h"
#include "HttpClient.h"
#include "../core/Logging.h"
#include "../core/NetworkRange.h"
#include <algorithm>
#include <cstring>
#include <pugixml.hpp>

namespace plug_scan {

namespace {
const char* SERVICE = "urn:Belkin:service:basicevent:1";
const char* CONTROL_PATH = "/upnp/control/basicevent1";

uint32_t resolve(const std::string& host){
    uint32_t addr = 0;
    if(!parse_ipv4(host, addr)) throw DeviceError("invalid device address: " + host);
    return addr;
}

bool load_xml(const std::string& xml, pugi::xml_document& doc){
    // comments, DOCTYPE and processing instructions are skipped; entities and CDATA are decoded
    const pugi::xml_parse_result res = doc.load_buffer(xml.data(), xml.size(), pugi::parse_default, pugi::encoding_utf8);
    if(!res){
        Logger::instance().trace(std::string("XML parse error: ") + res.description() + " at offset " + std::to_string(res.offset));
        return false;
    }
    return true;
}

const char* local_name(const char* name){
    const char* colon = std::strrchr(name, ':');
    return colon ? colon + 1 : name;
}

// First element (depth-first) whose name matches tag, ignoring any namespace prefix.
pugi::xml_node find_element(const pugi::xml_node& root, const std::string& tag){
    return root.find_node([&](const pugi::xml_node& n){
        return n.type() == pugi::node_element && tag == local_name(n.name());
    });
}

std::optional<std::string> element_text(const pugi::xml_node& root, const std::string& tag){
    pugi::xml_node n = find_element(root, tag);
    if(!n) return std::nullopt;
    std::string text;
    for(const pugi::xml_node& c : n.children()){
        if(c.type() == pugi::node_pcdata || c.type() == pugi::node_cdata) text += c.value();
    }
    return trim(text);
}
}

std::optional<std::string> xml_tag_value(const std::string& xml, const std::string& tag){
    pugi::xml_document doc;
    if(!load_xml(xml, doc)) return std::nullopt;
    return element_text(doc, tag);
}

std::optional<DeviceInfo> parse_setup_xml(const std::string& xml){
    pugi::xml_document doc;
    if(!load_xml(xml, doc)) return std::nullopt;
    auto udn = element_text(doc, "UDN");
    if(!udn || udn->empty()) return std::nullopt;
    DeviceInfo info;
    info.udn = *udn;
    info.name = element_text(doc, "friendlyName").value_or("");
    info.model = element_text(doc, "modelName").value_or("");
    info.serial = element_text(doc, "serialNumber").value_or("");
    if(info.name.empty()) info.name = info.model.empty() ? info.udn : info.model;
    return info;
}

PowerState parse_binary_state(const std::string& soap_body){
    auto v = xml_tag_value(soap_body, "BinaryState");
    if(!v || v->empty()) return PowerState::Unknown;
    std::string head = v->substr(0, v->find('|'));
    if(head == "0") return PowerState::Off;
    if(head == "1" || head == "8") return PowerState::On;
    return PowerState::Unknown;
}

std::string soap_envelope(const std::string& action, const std::string& args_xml){
    return std::string("<?xml version=\"1.0\" encoding=\"utf-8\"?>")
        + "<s:Envelope xmlns:s=\"http://schemas.xmlsoap.org/soap/envelope/\" s:encodingStyle=\"http://schemas.xmlsoap.org/soap/encoding/\">"
        + "<s:Body><u:" + action + " xmlns:u=\"" + SERVICE + "\">" + args_xml + "</u:" + action + "></s:Body></s:Envelope>";
}

std::optional<DeviceInfo> UpnpDeviceControl::identify(const std::string& host, uint16_t port, std::chrono::milliseconds timeout){
    HttpResponse resp;
    try {
        resp = http_request(resolve(host), port, "GET", "/setup.xml", {}, "", timeout);
    } catch(const HttpError& ex) {
        throw DeviceError(ex.what());
    }
    if(resp.status != 200){
        Logger::instance().debug("identify " + host + ": HTTP " + std::to_string(resp.status));
        return std::nullopt;
    }
    auto info = parse_setup_xml(resp.body);
    if(!info) return std::nullopt;
    info->host = host;
    info->port = port;
    return info;
}

std::string UpnpDeviceControl::call(const Device& device, const std::string& action, const std::string& args_xml, std::chrono::milliseconds timeout){
    HeaderList headers = {
        {"Content-Type", "text/xml; charset=\"utf-8\""},
        {"SOAPACTION", std::string("\"") + SERVICE + "#" + action + "\""},
    };
    HttpResponse resp;
    try {
        resp = http_request(resolve(device.host), device.port, "POST", CONTROL_PATH, headers, soap_envelope(action, args_xml), timeout);
    } catch(const HttpError& ex) {
        throw DeviceError(ex.what());
    }
    if(resp.status != 200) throw DeviceError(action + " returned HTTP " + std::to_string(resp.status));
    return resp.body;
}

PowerState UpnpDeviceControl::query_state(const Device& device, std::chrono::milliseconds timeout){
    return parse_binary_state(call(device, "GetBinaryState", "", timeout));
}

void UpnpDeviceControl::set_state(const Device& device, bool on, std::chrono::milliseconds timeout){
    std::string body = call(device, "SetBinaryState", std::string("<BinaryState>") + (on ? "1" : "0") + "</BinaryState>", timeout);
    if(body.find("Error") != std::string::npos && xml_tag_value(body, "errorCode"))
        throw DeviceError("SetBinaryState rejected: " + xml_tag_value(body, "errorDescription").value_or("device error"));
}

CommandResult UpnpDeviceControl::invoke(const Device& device, const std::string& command, const std::vector<std::string>& args,
                                        std::chrono::milliseconds timeout){
    const auto& cmds = supported_commands();
    if(std::find(cmds.begin(), cmds.end(), command) == cmds.end()) throw DeviceError("Unsupported command: " + command);
    if(!args.empty()) Logger::instance().debug("invoke " + command + ": ignoring " + std::to_string(args.size()) + " arguments");
    CommandResult r;
    r.command = command;
    if(command == "get_state"){
        r.state = query_state(device, timeout);
    } else if(command == "on" || command == "off"){
        set_state(device, command == "on", timeout);
        r.state = command == "on" ? PowerState::On : PowerState::Off;
    } else {
        PowerState cur = query_state(device, timeout);
        if(cur == PowerState::Unknown) throw DeviceError("cannot toggle: current state unknown");
        set_state(device, cur == PowerState::Off, timeout);
        r.state = cur == PowerState::Off ? PowerState::On : PowerState::Off;
    }
    r.message = device.display_name() + " is " + power_state_name(*r.state);
    return r;
}

}
