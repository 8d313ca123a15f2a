#include "string.hpp"


void to_string(int num, char* buffer, int base)
{
    int i = 0;
    bool is_negative = false;

    if (num == 0) {
        buffer[i++] = '0';
        buffer[i] = '\0';
        return;
    }

    // Based on the behavior of itoa()
    if (num < 0 and base == 10) {
        is_negative = true;
    }

    // Negating INT_MIN overflows, so work with the unsigned magnitude.
    unsigned int value = is_negative ? 0u - static_cast<unsigned int>(num)
                                     : static_cast<unsigned int>(num);

    while (value not_eq 0) {
        const int rem = value % base;
        buffer[i++] = (rem > 9) ? (rem - 10) + 'a' : rem + '0';
        value = value / base;
    }

    if (is_negative) {
        buffer[i++] = '-';
    }

    buffer[i] = '\0';

    str_reverse(buffer, i);
}
