#include "utils.hpp"
#include "log.hpp"

#include <asio.hpp>
#include <openssl/evp.h>
#include <openssl/sha.h>

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <netinet/in.h>
#include <sys/utsname.h>
#include <unistd.h>

#include <cstdint>
#include <exception>
#include <iomanip>
#include <sstream>

std::string hex_from_bytes(const std::vector<unsigned char>& b){
    std::ostringstream oss;
    for(auto c: b) oss << std::hex << std::setw(2) << std::setfill('0') << (int)c;
    return oss.str();
}

std::vector<unsigned char> sha256_bytes(const std::string &data){
    std::vector<unsigned char> out(SHA256_DIGEST_LENGTH);
    SHA256((const unsigned char*)data.data(), data.size(), out.data());
    return out;
}

std::string sha256_hex(const std::string &data){
    return hex_from_bytes(sha256_bytes(data));
}

std::string base64_encode(const std::string& data){
    if(data.empty()) return "";
    std::string out(4 * ((data.size() + 2) / 3), '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                  reinterpret_cast<const unsigned char*>(data.data()),
                                  static_cast<int>(data.size()));
    out.resize(written < 0 ? 0 : static_cast<std::size_t>(written));
    return out;
}

namespace {

bool is_base64_char(unsigned char c){
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
           (c >= '0' && c <= '9') || c == '+' || c == '/';
}

} // namespace

bool base64_decode(const std::string& encoded, std::string& out){
    out.clear();
    if(encoded.empty()) return true;
    if(encoded.size() % 4 != 0) return false;

    std::size_t padding = 0;
    for(std::size_t i = 0; i < encoded.size(); ++i){
        unsigned char c = static_cast<unsigned char>(encoded[i]);
        if(c == '='){
            // only the last two characters may be padding
            if(i + 2 < encoded.size()) return false;
            ++padding;
            continue;
        }
        if(padding > 0 || !is_base64_char(c)) return false;
    }

    std::string decoded(3 * (encoded.size() / 4), '\0');
    int n = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(&decoded[0]),
                            reinterpret_cast<const unsigned char*>(encoded.data()),
                            static_cast<int>(encoded.size()));
    if(n < 0 || static_cast<std::size_t>(n) < padding) return false;
    decoded.resize(static_cast<std::size_t>(n) - padding);
    out = std::move(decoded);
    return true;
}

bool is_valid_utf8(std::string_view text){
    std::size_t i = 0;
    const std::size_t n = text.size();
    while(i < n){
        unsigned char c = static_cast<unsigned char>(text[i]);
        std::size_t extra = 0;
        uint32_t cp = 0;
        if(c < 0x80){ ++i; continue; }
        else if((c & 0xE0) == 0xC0){ extra = 1; cp = c & 0x1F; }
        else if((c & 0xF0) == 0xE0){ extra = 2; cp = c & 0x0F; }
        else if((c & 0xF8) == 0xF0){ extra = 3; cp = c & 0x07; }
        else return false;
        if(i + extra >= n) return false;
        for(std::size_t k = 1; k <= extra; ++k){
            unsigned char cc = static_cast<unsigned char>(text[i + k]);
            if((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }
        // overlong forms, surrogates and out of range code points
        if((extra == 1 && cp < 0x80) || (extra == 2 && cp < 0x800) ||
           (extra == 3 && (cp < 0x10000 || cp > 0x10FFFF)) ||
           (cp >= 0xD800 && cp <= 0xDFFF)) return false;
        i += extra + 1;
    }
    return true;
}

double unix_time_now(){
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::duration<double>>(now).count();
}

std::string detect_hostname(){
    char hostname[256] = {0};
    if(gethostname(hostname, sizeof(hostname) - 1) != 0 || hostname[0] == '\0'){
        return "UnknownHost";
    }
    return hostname;
}

std::string detect_platform(){
    struct utsname info{};
    if(uname(&info) != 0) return "Unknown";
    return info.sysname;
}

std::string detect_local_ip(){
    // Connecting a datagram socket sends nothing; it only selects the route.
    try {
        asio::io_context io;
        asio::ip::udp::socket route(io);
        route.connect(asio::ip::udp::endpoint(asio::ip::make_address("8.8.8.8"), 80));
        return route.local_endpoint().address().to_string();
    } catch(const std::exception& e) {
        log_debug(nullptr, "route lookup failed: {}", e.what());
    }
    try {
        asio::io_context io;
        asio::ip::tcp::resolver resolver(io);
        for(const auto& entry : resolver.resolve(asio::ip::tcp::v4(), detect_hostname(), "")) {
            return entry.endpoint().address().to_string();
        }
    } catch(const std::exception& e) {
        log_debug(nullptr, "hostname lookup failed: {}", e.what());
    }
    return "127.0.0.1";
}

std::optional<std::string> subnet_broadcast_for(const std::string& ip){
    in_addr target{};
    if(inet_pton(AF_INET, ip.c_str(), &target) != 1) return std::nullopt;

    struct ifaddrs* ifs = nullptr;
    if(getifaddrs(&ifs) == 0){
        std::optional<std::string> result;
        for(auto* it = ifs; it != nullptr; it = it->ifa_next){
            if(!it->ifa_addr || !it->ifa_netmask) continue;
            if(it->ifa_addr->sa_family != AF_INET) continue;
            auto* addr = reinterpret_cast<sockaddr_in*>(it->ifa_addr);
            if(addr->sin_addr.s_addr != target.s_addr) continue;
            auto* mask = reinterpret_cast<sockaddr_in*>(it->ifa_netmask);
            in_addr bcast{};
            bcast.s_addr = addr->sin_addr.s_addr | ~mask->sin_addr.s_addr;
            char buf[INET_ADDRSTRLEN] = {0};
            if(inet_ntop(AF_INET, &bcast, buf, sizeof(buf))) result = std::string(buf);
            break;
        }
        freeifaddrs(ifs);
        if(result) return result;
    }

    auto last_dot = ip.rfind('.');
    if(last_dot == std::string::npos) return std::nullopt;
    return ip.substr(0, last_dot) + ".255";
}

BackgroundThread::~BackgroundThread(){
    if(thread_.joinable()) thread_.join();
}

void BackgroundThread::start(std::string name, std::function<void()> body){
    name_ = std::move(name);
    std::promise<void> done;
    finished_ = done.get_future();
    thread_ = std::thread([body = std::move(body), done = std::move(done), label = name_]() mutable {
        try {
            body();
        } catch(const std::exception& e) {
            log_error(nullptr, "thread '{}' ended with exception: {}", label, e.what());
        } catch(...) {
            log_error(nullptr, "thread '{}' ended with unknown exception", label);
        }
        done.set_value();
    });
}

bool BackgroundThread::join_for(std::chrono::milliseconds timeout){
    if(!thread_.joinable()) return true;
    if(finished_.valid() &&
       finished_.wait_for(timeout) != std::future_status::ready){
        thread_.detach();
        return false;
    }
    thread_.join();
    return true;
}
