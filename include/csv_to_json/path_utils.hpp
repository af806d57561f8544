#pragma once
#include <string>
#include <string_view>

namespace ctj {

// "reports/2024 Q1.csv" -> "2024_Q1.json"; empty or unusable -> "converted.json".
std::string json_filename_for(std::string_view upload_name);

// attachment; filename="<name>"
std::string content_disposition_for(std::string_view filename);

}
