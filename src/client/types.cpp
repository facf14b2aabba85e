#include <keyco/client/types.h>

namespace keyco::client {

const char* ToString(Operation op) {
    switch (op) {
        case Operation::rewrite: return "rewrite";
        case Operation::chat: return "chat";
    }
    return "unknown";
}

} // namespace keyco::client
