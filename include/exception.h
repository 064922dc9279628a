
#ifndef EXCEPTION_H
#define EXCEPTION_H

#include <string>

using namespace std;


class BGException : public std::exception {
    string message;
    string data;

public:
    BGException(string msg) : message(msg) {}
    BGException(string msg, string d) : message(msg), data(d) {}

    string detail() { return message; }
    string getData() { return data; }
    const char *what() const noexcept { return message.c_str(); }
};


#endif
