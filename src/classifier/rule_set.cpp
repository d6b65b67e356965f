#include "classifier/rule_set.hpp"

namespace piiredact {

RuleSet RuleSet::defaults() {
    RuleSet rules;
    auto& a = rules.aliases;

    a.phone       = {"phone", "contact", "alt_phone", "mobile", "phone_number", "mobile_number"};
    a.aadhaar     = {"aadhar", "aadhaar", "aadhar_number", "aadhaar_number"};
    a.passport    = {"passport", "passport_no", "passport_number"};
    a.upi         = {"upi", "upi_id", "vpa"};
    a.ip          = {"ip", "ip_address"};
    a.name        = {"name", "full_name"};
    a.first_name  = {"first_name"};
    a.last_name   = {"last_name"};
    a.email       = {"email", "alt_email", "username"};
    a.address     = {"address"};
    a.city        = {"city"};
    a.postal_code = {"pin_code", "pincode", "pin", "postal_code", "zip", "zip_code"};
    a.device      = {"device_id"};
    a.latitude    = {"latitude", "lat"};
    a.longitude   = {"longitude", "lon", "lng"};

    rules.upi_providers = {
        "upi", "ybl", "ibl", "axl", "paytm", "apl",
        "okaxis", "oksbi", "okicici", "okhdfcbank",
        "axisbank", "hdfcbank", "icici", "sbi", "kotak", "yesbank",
    };

    return rules;
}

} // namespace piiredact
