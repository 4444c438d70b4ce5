#pragma once
#include <string>
#include <vector>

/// Accumulates a markdown document.
class ReportEngine {
public:
    void addTitle(const std::string& title);
    void addParagraph(const std::string& text);
    void addTable(const std::string& title, const std::vector<std::string>& headers, const std::vector<std::vector<std::string>>& rows);

    const std::string& str() const noexcept { return body_; }

    /// Throws Synthra::IOException when the file cannot be written.
    void save(const std::string& filePath) const;

private:
    std::string body_;
};
