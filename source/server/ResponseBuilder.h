#ifndef RESPONSEBUILDER_H
#define RESPONSEBUILDER_H

#include <nlohmann/json.hpp>
#include <string>
using namespace std;
using json = nlohmann::json;

// Uniform envelope for every operation:
//   {"status":"success","data":{...}}
//   {"status":"error","code":"not_found","message":"..."}
class ResponseBuilder
{
public:
    json success(const json &data = json::object()) const
    {
        return {{"status", "success"}, {"data", data}};
    }

    json error(const string &code, const string &message) const
    {
        return {{"status", "error"}, {"code", code}, {"message", message}};
    }

    json error(const string &code, const string &message, const json &details) const
    {
        json response = error(code, message);
        response["details"] = details;
        return response;
    }
};

#endif // RESPONSEBUILDER_H
