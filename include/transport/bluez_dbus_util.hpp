#pragma once
#include <cctype>
#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

#include <systemd/sd-bus.h>

// Helpers shared by the BlueZ driver translation units.
namespace transport
{
namespace dbus
{

inline std::string upper(std::string s)
{
    for (auto &c : s)
        c = (char)std::toupper((unsigned char)c);
    return s;
}

inline bool mac_eq(const std::string &a, const std::string &b)
{
    return upper(a) == upper(b);
}

// "/org/bluez/hci0/dev_AA_BB_CC_DD_EE_FF[/service000a/...]" -> "AA:BB:CC:DD:EE:FF"
inline std::string path_to_mac(const std::string &obj_path)
{
    auto pos = obj_path.find("/dev_");
    if (pos == std::string::npos)
        return {};
    std::string tail = obj_path.substr(pos + 5, 17);
    if (tail.size() != 17)
        return {};
    for (auto &c : tail)
        if (c == '_')
            c = ':';
    return upper(tail);
}

// ("/org/bluez/hci0", "aa:bb:..") -> "/org/bluez/hci0/dev_AA_BB_.."
inline std::string mac_to_dev_path(const std::string &adapter_path, const std::string &mac)
{
    std::string tail = upper(mac);
    for (auto &c : tail)
        if (c == ':')
            c = '_';
    return adapter_path + "/dev_" + tail;
}

// device object itself, not one of its GATT children
inline bool is_device_path(const std::string &adapter_path, const std::string &obj_path)
{
    const std::string prefix = adapter_path + "/dev_";
    return obj_path.rfind(prefix, 0) == 0 && obj_path.find('/', prefix.size()) == std::string::npos;
}

inline void unref_slot(sd_bus_slot *&s)
{
    if (s)
    {
        sd_bus_slot_unref(s);
        s = nullptr;
    }
}

inline const char *err_text(const sd_bus_error &err, int r)
{
    return err.message ? err.message : strerror(-r);
}

// variant "s"
inline int read_var_s(sd_bus_message *m, std::string &out)
{
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "s");
    if (r < 0)
        return r;
    const char *s = nullptr;
    r             = sd_bus_message_read(m, "s", &s);
    if (r >= 0 && s)
        out = s;
    int r2 = sd_bus_message_exit_container(m);
    return r < 0 ? r : r2;
}

// variant "n" (int16)
inline int read_var_i16(sd_bus_message *m, int16_t &out)
{
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "n");
    if (r < 0)
        return r;
    r      = sd_bus_message_read(m, "n", &out);
    int r2 = sd_bus_message_exit_container(m);
    return r < 0 ? r : r2;
}

// variant "b"
inline int read_var_b(sd_bus_message *m, bool &out)
{
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "b");
    if (r < 0)
        return r;
    int b  = 0;
    r      = sd_bus_message_read(m, "b", &b);
    out    = (b != 0);
    int r2 = sd_bus_message_exit_container(m);
    return r < 0 ? r : r2;
}

// variant "as"
inline int read_var_as(sd_bus_message *m, std::vector<std::string> &out)
{
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "as");
    if (r < 0)
        return r;
    r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "s");
    if (r < 0)
        return r;
    while (true)
    {
        const char *u  = nullptr;
        int         rr = sd_bus_message_read_basic(m, 's', &u);
        if (rr < 0)
            return rr;
        if (rr == 0)
            break;
        if (u)
            out.emplace_back(u);
    }
    int r1 = sd_bus_message_exit_container(m);
    int r2 = sd_bus_message_exit_container(m);
    return (r1 < 0) ? r1 : r2;
}

// variant "o"
inline int read_var_o(sd_bus_message *m, std::string &out)
{
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "o");
    if (r < 0)
        return r;
    const char *s = nullptr;
    r             = sd_bus_message_read(m, "o", &s);
    if (r >= 0 && s)
        out = s;
    int r2 = sd_bus_message_exit_container(m);
    return r < 0 ? r : r2;
}

// one {sv} entry with a basic-typed value
template <typename T>
inline int append_dict_entry(sd_bus_message *m, const char *key, const char *sig, T value)
{
    int r = sd_bus_message_open_container(m, SD_BUS_TYPE_DICT_ENTRY, "sv");
    if (r < 0)
        return r;
    if ((r = sd_bus_message_append(m, "s", key)) < 0)
        return r;
    if ((r = sd_bus_message_open_container(m, SD_BUS_TYPE_VARIANT, sig)) < 0)
        return r;
    if ((r = sd_bus_message_append(m, sig, value)) < 0)
        return r;
    if ((r = sd_bus_message_close_container(m)) < 0)
        return r;
    return sd_bus_message_close_container(m);
}

}  // namespace dbus
}  // namespace transport
