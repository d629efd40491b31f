#include "search/candidate_extraction.hpp"
#include "utils/debug_log.hpp"

namespace candidate_extraction {

const std::string &extraction_script() {
    // Result cards keep name, connection degree and headline on separate text lines.
    static const std::string script =
        "(function(){"
        "var items=Array.prototype.slice.call(document.querySelectorAll('.search-results-container li'),0,30);"
        "return items.map(function(li){"
        "var link=li.querySelector('a[href*=\"/in/\"]');"
        "var lines=(li.innerText||li.textContent||'').split('\\n')"
        ".map(function(l){return l.trim();})"
        ".filter(function(l){return l&&l!=='Status is offline';});"
        "var name='';"
        "for(var i=0;i<lines.length;i++){"
        "var line=lines[i];"
        "if(line.indexOf('View ')>0&&/profile/.test(line)&&line.indexOf('\\u2022')<0&&line.indexOf('degree')<0){"
        "var before=line.substring(0,line.indexOf('View ')).trim();"
        "if(before.length>2&&before.length<50){name=before;break;}"
        "}"
        "}"
        "if(!name){"
        "var hidden=li.querySelector('span[aria-hidden=\"true\"]');"
        "if(hidden){name=(hidden.textContent||'').trim();}"
        "}"
        "var headline='',afterDegree=false;"
        "for(var j=0;j<lines.length;j++){"
        "var l=lines[j];"
        "if(l.indexOf('degree connection')>=0){afterDegree=true;continue;}"
        "if(afterDegree&&l.length>5&&l.indexOf('degree')<0&&l.indexOf('View ')<0&&l.indexOf('Status is')<0&&l.indexOf('Message')<0){headline=l;break;}"
        "}"
        "if(!headline){"
        "for(var k=0;k<lines.length;k++){"
        "var c=lines[k];"
        "if(c.length>10&&c.length<200&&c!==name&&!/View |degree|Status|Message|mutual|follower/.test(c)){headline=c;break;}"
        "}"
        "}"
        "var url='';"
        "if(link&&link.href){url=link.href.split('?')[0];}"
        "return {name:name,headline:headline,profileUrl:url};"
        "}).filter(function(c){return c.name||c.profileUrl;});"
        "})()";
    return script;
}

static std::string string_field(const json &entry, const char *key) {
    if (entry.contains(key) && entry[key].is_string()) {
        return entry[key].get<std::string>();
    }
    return "";
}

std::vector<search_types::Candidate> normalize_extraction(const browser_driver::EvaluateResult &evaluate_result) {
    std::vector<search_types::Candidate> candidates;
    if (evaluate_result.kind != browser_driver::EvaluateValueKind::Structured || !evaluate_result.value.is_array()) {
        return candidates;
    }

    for (const auto &entry : evaluate_result.value) {
        if (!entry.is_object()) {
            continue;
        }
        search_types::Candidate candidate;
        candidate.name = string_field(entry, "name");
        candidate.headline = string_field(entry, "headline");
        candidate.profile_url = string_field(entry, "profileUrl");
        if (candidate.name.empty() && candidate.profile_url.empty()) {
            continue;
        }
        candidates.push_back(candidate);
    }
    return candidates;
}

std::vector<search_types::Candidate> extract_candidates_from_page(browser_driver::PageDriver &driver) {
    try {
        browser_driver::EvaluateResult evaluate_result = driver.evaluate_javascript(extraction_script());
        std::vector<search_types::Candidate> candidates = normalize_extraction(evaluate_result);
        debug_log::log("extract_candidates_from_page: " + std::to_string(candidates.size()) + " candidate(s)");
        return candidates;
    } catch (const std::exception &error) {
        debug_log::warn("Candidate extraction failed: " + std::string(error.what()));
        return {};
    }
}

} // namespace candidate_extraction
