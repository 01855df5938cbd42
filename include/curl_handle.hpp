/*
 * Service Monitor - libcurl Handles
 *
 * Owning pointers for easy handles and header/recipient lists.
 */

#pragma once

#include <memory>
#include <string>

#include <curl/curl.h>

struct CurlDeleter {
    void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};
using CurlPtr = std::unique_ptr<CURL, CurlDeleter>;

struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};
using SlistPtr = std::unique_ptr<curl_slist, SlistDeleter>;

// Appends to an owned list; the list is left untouched if curl runs out of memory
inline bool slist_append(SlistPtr& list, const std::string& item) {
    curl_slist* next = curl_slist_append(list.get(), item.c_str());
    if (!next) return false;
    // curl_slist_append returns the existing head unless the list was empty
    if (!list) list.reset(next);
    return true;
}
