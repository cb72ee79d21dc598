#include "VendorTable.hpp"
#include <unordered_map>

namespace lan_recon::scanner
{
    namespace
    {
        const std::unordered_map<std::string, std::string> &Table()
        {
            static const std::unordered_map<std::string, std::string> table = {
                // Apple
                {"00:03:93", "Apple"}, {"00:0A:95", "Apple"}, {"00:1B:63", "Apple"},
                {"00:1C:B3", "Apple"}, {"00:1E:C2", "Apple"}, {"00:23:DF", "Apple"},
                {"00:25:00", "Apple"}, {"28:CF:E9", "Apple"}, {"3C:07:54", "Apple"},
                {"40:6C:8F", "Apple"}, {"60:FB:42", "Apple"}, {"70:56:81", "Apple"},
                {"88:66:A5", "Apple"}, {"A4:5E:60", "Apple"}, {"AC:BC:32", "Apple"},
                {"D0:23:DB", "Apple"}, {"F0:18:98", "Apple"}, {"F4:5C:89", "Apple"},
                // Samsung
                {"00:12:47", "Samsung"}, {"00:15:99", "Samsung"}, {"00:16:32", "Samsung"},
                {"00:1D:25", "Samsung"}, {"5C:0A:5B", "Samsung"}, {"8C:77:12", "Samsung"},
                // Raspberry Pi
                {"B8:27:EB", "Raspberry Pi"}, {"DC:A6:32", "Raspberry Pi"}, {"E4:5F:01", "Raspberry Pi"},
                {"D8:3A:DD", "Raspberry Pi"}, {"28:CD:C1", "Raspberry Pi"},
                // Espressif (ESP8266 / ESP32 IoT modules)
                {"18:FE:34", "Espressif"}, {"24:0A:C4", "Espressif"}, {"30:AE:A4", "Espressif"},
                {"5C:CF:7F", "Espressif"}, {"84:F3:EB", "Espressif"}, {"A4:CF:12", "Espressif"},
                {"EC:FA:BC", "Espressif"},
                // Virtualisation
                {"00:05:69", "VMware"}, {"00:0C:29", "VMware"}, {"00:1C:14", "VMware"},
                {"00:50:56", "VMware"}, {"08:00:27", "Oracle VirtualBox"}, {"00:1C:42", "Parallels"},
                {"00:15:5D", "Microsoft Hyper-V"},
                // Networking
                {"00:00:0C", "Cisco"}, {"00:1A:A1", "Cisco"}, {"00:1B:54", "Cisco"},
                {"14:CC:20", "TP-Link"}, {"50:C7:BF", "TP-Link"}, {"C0:4A:00", "TP-Link"},
                {"EC:08:6B", "TP-Link"}, {"F4:F2:6D", "TP-Link"},
                {"00:09:5B", "Netgear"}, {"00:14:6C", "Netgear"}, {"20:4E:7F", "Netgear"},
                {"A0:40:A0", "Netgear"},
                {"00:1A:92", "ASUSTek"}, {"00:1D:60", "ASUSTek"}, {"2C:56:DC", "ASUSTek"},
                {"AC:22:0B", "ASUSTek"},
                {"00:05:5D", "D-Link"}, {"00:15:E9", "D-Link"}, {"1C:7E:E5", "D-Link"},
                {"00:15:6D", "Ubiquiti"}, {"00:27:22", "Ubiquiti"}, {"24:A4:3C", "Ubiquiti"},
                {"44:D9:E7", "Ubiquiti"}, {"78:8A:20", "Ubiquiti"}, {"F0:9F:C2", "Ubiquiti"},
                {"FC:EC:DA", "Ubiquiti"},
                {"4C:5E:0C", "MikroTik"}, {"64:D1:54", "MikroTik"}, {"6C:3B:6B", "MikroTik"},
                {"B8:69:F4", "MikroTik"}, {"CC:2D:E0", "MikroTik"}, {"E4:8D:8C", "MikroTik"},
                {"00:04:0E", "AVM"}, {"24:65:11", "AVM"}, {"3C:A6:2F", "AVM"}, {"C0:25:06", "AVM"},
                {"00:E0:FC", "Huawei"}, {"00:18:82", "Huawei"}, {"28:6E:D4", "Huawei"},
                {"48:46:FB", "Huawei"},
                // Storage
                {"00:11:32", "Synology"}, {"00:08:9B", "QNAP"}, {"24:5E:BE", "QNAP"},
                // Computers and chipsets
                {"00:02:B3", "Intel"}, {"00:13:E8", "Intel"}, {"00:1B:21", "Intel"},
                {"00:14:22", "Dell"}, {"00:1E:4F", "Dell"}, {"18:03:73", "Dell"},
                {"B8:AC:6F", "Dell"}, {"F8:B1:56", "Dell"},
                {"00:0B:CD", "Hewlett Packard"}, {"3C:D9:2B", "Hewlett Packard"},
                {"00:E0:4C", "Realtek"},
                // Printers
                {"00:80:77", "Brother"}, {"00:1B:A9", "Brother"}, {"00:1E:8F", "Canon"},
                {"00:26:AB", "Seiko Epson"}, {"64:EB:8C", "Seiko Epson"},
                // Cameras
                {"28:57:BE", "Hikvision"}, {"44:19:B6", "Hikvision"}, {"4C:BD:8F", "Hikvision"},
                {"C0:56:E3", "Hikvision"}, {"3C:EF:8C", "Dahua"}, {"90:02:A9", "Dahua"},
                {"E0:50:8B", "Dahua"},
                // Consumer electronics
                {"3C:5A:B4", "Google"}, {"54:60:09", "Google"}, {"F4:F5:D8", "Google"},
                {"F8:8F:CA", "Google"}, {"18:B4:30", "Nest Labs"}, {"64:16:66", "Nest Labs"},
                {"44:65:0D", "Amazon"}, {"68:37:E9", "Amazon"}, {"74:C2:46", "Amazon"},
                {"84:D6:D0", "Amazon"}, {"F0:27:2D", "Amazon"}, {"FC:A1:83", "Amazon"},
                {"00:0E:58", "Sonos"}, {"5C:AA:FD", "Sonos"}, {"94:9F:3E", "Sonos"},
                {"B8:E9:37", "Sonos"},
                {"B0:A7:37", "Roku"}, {"CC:6D:A0", "Roku"}, {"DC:3A:5E", "Roku"},
                {"00:1C:62", "LG Electronics"}, {"10:68:3F", "LG Electronics"}, {"A8:23:FE", "LG Electronics"},
                {"00:13:A9", "Sony"}, {"FC:0F:E6", "Sony"},
                {"00:09:BF", "Nintendo"}, {"00:1F:32", "Nintendo"}, {"98:B6:E9", "Nintendo"},
                {"00:17:88", "Philips Lighting"}, {"EC:B5:FA", "Philips Lighting"},
                {"28:6C:07", "Xiaomi"}, {"64:09:80", "Xiaomi"}, {"78:11:DC", "Xiaomi"},
                {"F8:A4:5F", "Xiaomi"},
                {"94:65:2D", "OnePlus"}, {"C0:EE:FB", "OnePlus"},
            };
            return table;
        }
    }

    std::optional<std::string> LookupVendor(const common::HardwareAddress &mac)
    {
        const auto &table = Table();
        auto it = table.find(common::OuiPrefix(mac));
        if (it == table.end())
            return std::nullopt;
        return it->second;
    }

    size_t VendorTableSize()
    {
        return Table().size();
    }
}
