#ifndef PSRISK_JSON_HPP
#define PSRISK_JSON_HPP

#include <sstream>
#include <string>
#include <vector>

namespace psrisk {

std::string json_escape(const std::string& value);

// Streaming JSON emitter. Commas are inserted automatically.
class JsonWriter {
public:
    JsonWriter& begin_object();
    JsonWriter& end_object();
    JsonWriter& begin_array();
    JsonWriter& end_array();
    JsonWriter& key(const std::string& name);

    JsonWriter& value(const std::string& text);
    JsonWriter& value(const char* text);
    JsonWriter& value(int number);
    JsonWriter& value(double number);
    JsonWriter& value(bool flag);
    JsonWriter& null();

    JsonWriter& string_array(const std::vector<std::string>& items);

    std::string str() const;

private:
    void before_value();

    std::ostringstream out_;
    std::vector<bool> first_;
    bool after_key_ = false;
};

}  // namespace psrisk

#endif  // PSRISK_JSON_HPP
